#pragma once

#include "edgexfer/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace edgexfer::transfer {

/// Random-access reader over the bytes being uploaded. Safe to call from
/// several workers at once.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual Result<std::vector<std::uint8_t>> read_chunk(std::uint64_t offset, std::uint64_t length) const = 0;
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;
};

class FileChunkSource final : public ChunkSource {
public:
    explicit FileChunkSource(std::filesystem::path path);

    Result<std::vector<std::uint8_t>> read_chunk(std::uint64_t offset, std::uint64_t length) const override;
    [[nodiscard]] std::uint64_t size() const noexcept override { return size_; }

private:
    std::filesystem::path path_;
    std::uint64_t size_ = 0;
};

class MemoryChunkSource final : public ChunkSource {
public:
    explicit MemoryChunkSource(std::vector<std::uint8_t> data);

    Result<std::vector<std::uint8_t>> read_chunk(std::uint64_t offset, std::uint64_t length) const override;
    [[nodiscard]] std::uint64_t size() const noexcept override { return data_.size(); }

private:
    std::vector<std::uint8_t> data_;
};

} // namespace edgexfer::transfer
