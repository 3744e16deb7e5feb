#include "edgexfer/transfer/object_store.hpp"

#include "edgexfer/core/files.hpp"
#include "edgexfer/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iterator>

namespace edgexfer::transfer {
namespace fs = std::filesystem;

std::string staging_key(const std::string& session_id, std::uint32_t index) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%08u", index);
    return staging_prefix(session_id) + buffer;
}

std::string staging_prefix(const std::string& session_id) {
    return "staging/" + session_id + "/";
}

std::string object_key_for(const std::string& content_hash, const std::string& file_id) {
    return "objects/" + content_hash + "/" + file_id;
}

bool is_valid_object_key(const std::string& key) noexcept {
    if (key.empty() || key.front() == '/' || key.back() == '/' || key.find('\\') != std::string::npos) {
        return false;
    }

    std::size_t start = 0;
    while (start <= key.size()) {
        const auto end = key.find('/', start);
        const auto segment = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return true;
}

// ---------------------------------------------------------------------------
// FilesystemObjectStore
// ---------------------------------------------------------------------------

FilesystemObjectStore::FilesystemObjectStore(fs::path root) : root_(std::move(root)) {}

Result<fs::path> FilesystemObjectStore::resolve(const std::string& key) const {
    if (!is_valid_object_key(key)) {
        return Err<fs::path>(ErrorKind::InvalidArgument, "Invalid object key: " + key);
    }
    return Ok(root_ / fs::path(key));
}

Result<void> FilesystemObjectStore::put(const std::string& key, const std::vector<std::uint8_t>& data) {
    auto path = resolve(key);
    if (path.is_error()) {
        return Err<void>(path.error());
    }
    return core::write_file_atomic(path.value(), std::string(data.begin(), data.end()));
}

Result<std::vector<std::uint8_t>> FilesystemObjectStore::get(const std::string& key) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return Err<std::vector<std::uint8_t>>(path.error());
    }

    std::ifstream input(path.value(), std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::NotFound, "No such object: " + key);
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to read object: " + key);
    }
    return Ok(std::move(data));
}

Result<void> FilesystemObjectStore::remove(const std::string& key) {
    auto path = resolve(key);
    if (path.is_error()) {
        return Err<void>(path.error());
    }
    std::error_code ec;
    fs::remove(path.value(), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to remove object " + key + ": " + ec.message());
    }
    return Ok();
}

bool FilesystemObjectStore::exists(const std::string& key) const {
    auto path = resolve(key);
    if (path.is_error()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(path.value(), ec);
}

Result<void> FilesystemObjectStore::compose(const std::string& destination, const std::vector<std::string>& parts) {
    auto target = resolve(destination);
    if (target.is_error()) {
        return Err<void>(target.error());
    }
    if (auto res = core::ensure_parent_exists(target.value()); res.is_error()) {
        return res;
    }

    fs::path temp = target.value();
    temp += ".compose-" + core::generate_uuid();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorKind::Io, "Failed to create object: " + destination);
        }

        for (const auto& part : parts) {
            auto part_path = resolve(part);
            if (part_path.is_error()) {
                out.close();
                std::error_code ignored;
                fs::remove(temp, ignored);
                return Err<void>(part_path.error());
            }
            std::ifstream in(part_path.value(), std::ios::binary);
            if (!in) {
                out.close();
                std::error_code ignored;
                fs::remove(temp, ignored);
                return Err<void>(ErrorKind::Integrity, "Missing part " + part + " for " + destination);
            }
            out << in.rdbuf();
        }

        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err<void>(ErrorKind::Io, "Failed to write object: " + destination);
        }
    }

    std::error_code ec;
    fs::rename(temp, target.value(), ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Err<void>(ErrorKind::Io, "Failed to move object into place: " + destination);
    }
    return Ok();
}

Result<std::size_t> FilesystemObjectStore::remove_prefix(const std::string& prefix) {
    std::string trimmed = prefix;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto dir = resolve(trimmed);
    if (dir.is_error()) {
        return Err<std::size_t>(dir.error());
    }

    std::error_code ec;
    if (!fs::exists(dir.value(), ec)) {
        return Ok(std::size_t{0});
    }
    const auto removed = fs::remove_all(dir.value(), ec);
    if (ec) {
        return Err<std::size_t>(ErrorKind::Io, "Failed to remove " + prefix + ": " + ec.message());
    }
    spdlog::debug("Removed {} path(s) under {}", removed, prefix);
    return Ok(static_cast<std::size_t>(removed));
}

// ---------------------------------------------------------------------------
// InMemoryObjectStore
// ---------------------------------------------------------------------------

Result<void> InMemoryObjectStore::put(const std::string& key, const std::vector<std::uint8_t>& data) {
    if (!is_valid_object_key(key)) {
        return Err<void>(ErrorKind::InvalidArgument, "Invalid object key: " + key);
    }
    std::lock_guard lock(mutex_);
    objects_[key] = data;
    return Ok();
}

Result<std::vector<std::uint8_t>> InMemoryObjectStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::NotFound, "No such object: " + key);
    }
    return Ok(it->second);
}

Result<void> InMemoryObjectStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    objects_.erase(key);
    return Ok();
}

bool InMemoryObjectStore::exists(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return objects_.count(key) > 0;
}

Result<void> InMemoryObjectStore::compose(const std::string& destination, const std::vector<std::string>& parts) {
    if (!is_valid_object_key(destination)) {
        return Err<void>(ErrorKind::InvalidArgument, "Invalid object key: " + destination);
    }

    std::lock_guard lock(mutex_);
    std::vector<std::uint8_t> joined;
    for (const auto& part : parts) {
        auto it = objects_.find(part);
        if (it == objects_.end()) {
            return Err<void>(ErrorKind::Integrity, "Missing part " + part + " for " + destination);
        }
        joined.insert(joined.end(), it->second.begin(), it->second.end());
    }
    objects_[destination] = std::move(joined);
    return Ok();
}

Result<std::size_t> InMemoryObjectStore::remove_prefix(const std::string& prefix) {
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;
    for (auto it = objects_.begin(); it != objects_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = objects_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return Ok(removed);
}

std::size_t InMemoryObjectStore::size() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

std::vector<std::string> InMemoryObjectStore::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(objects_.size());
    for (const auto& [key, data] : objects_) {
        result.push_back(key);
    }
    return result;
}

} // namespace edgexfer::transfer
