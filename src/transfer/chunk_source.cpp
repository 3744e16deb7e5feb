#include "edgexfer/transfer/chunk_source.hpp"

#include <fstream>
#include <string>

namespace edgexfer::transfer {

FileChunkSource::FileChunkSource(std::filesystem::path path) : path_(std::move(path)) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    size_ = ec ? 0 : static_cast<std::uint64_t>(size);
}

Result<std::vector<std::uint8_t>> FileChunkSource::read_chunk(std::uint64_t offset, std::uint64_t length) const {
    if (offset > size_ || length > size_ - offset) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument,
                                              "Range " + std::to_string(offset) + "+" + std::to_string(length) +
                                              " beyond end of " + path_.string());
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to open " + path_.string());
    }
    input.seekg(static_cast<std::streamoff>(offset));

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(length));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(input.gcount()) != length) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Io, "Short read from " + path_.string());
    }
    return Ok(std::move(buffer));
}

MemoryChunkSource::MemoryChunkSource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

Result<std::vector<std::uint8_t>> MemoryChunkSource::read_chunk(std::uint64_t offset, std::uint64_t length) const {
    if (offset > data_.size() || length > data_.size() - offset) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument, "Range beyond end of buffer");
    }
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(length)));
}

} // namespace edgexfer::transfer
