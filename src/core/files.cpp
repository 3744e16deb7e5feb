#include "edgexfer/core/files.hpp"

#include "edgexfer/core/ids.hpp"

#include <fstream>
#include <sstream>

namespace edgexfer::core {
namespace fs = std::filesystem;

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorKind::Io, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return res;
    }

    fs::path temp = path;
    temp += ".tmp-" + generate_uuid();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorKind::Io, "Failed to create file: " + temp.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err<void>(ErrorKind::Io, "Failed to write file: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err<void>(ErrorKind::Io, "Failed to move file into place: " + path.string());
    }
    return Ok();
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::NotFound, "Failed to open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Io, "Failed to read file: " + path.string());
    }
    return Ok(buffer.str());
}

} // namespace edgexfer::core
