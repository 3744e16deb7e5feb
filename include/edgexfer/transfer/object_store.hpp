#pragma once

#include "edgexfer/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgexfer::transfer {

/// Key of chunk `index` while its session is in flight.
std::string staging_key(const std::string& session_id, std::uint32_t index);

/// Prefix covering every staged chunk of a session.
std::string staging_prefix(const std::string& session_id);

/// Key of a finalized object.
std::string object_key_for(const std::string& content_hash, const std::string& file_id);

/**
 * @brief Blob storage reached by key
 *
 * Keys are relative, '/'-separated paths without "." or ".." segments.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual Result<void> put(const std::string& key, const std::vector<std::uint8_t>& data) = 0;
    virtual Result<std::vector<std::uint8_t>> get(const std::string& key) const = 0;

    /// Removing a missing key succeeds.
    virtual Result<void> remove(const std::string& key) = 0;

    [[nodiscard]] virtual bool exists(const std::string& key) const = 0;

    /// Concatenates `parts` in order into `destination`. Parts are left in place.
    virtual Result<void> compose(const std::string& destination, const std::vector<std::string>& parts) = 0;

    /// Removes every key under `prefix`; returns how many were removed.
    virtual Result<std::size_t> remove_prefix(const std::string& prefix) = 0;
};

[[nodiscard]] bool is_valid_object_key(const std::string& key) noexcept;

class FilesystemObjectStore final : public ObjectStore {
public:
    explicit FilesystemObjectStore(std::filesystem::path root);

    Result<void> put(const std::string& key, const std::vector<std::uint8_t>& data) override;
    Result<std::vector<std::uint8_t>> get(const std::string& key) const override;
    Result<void> remove(const std::string& key) override;
    [[nodiscard]] bool exists(const std::string& key) const override;
    Result<void> compose(const std::string& destination, const std::vector<std::string>& parts) override;
    Result<std::size_t> remove_prefix(const std::string& prefix) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    Result<std::filesystem::path> resolve(const std::string& key) const;

    std::filesystem::path root_;
};

class InMemoryObjectStore final : public ObjectStore {
public:
    Result<void> put(const std::string& key, const std::vector<std::uint8_t>& data) override;
    Result<std::vector<std::uint8_t>> get(const std::string& key) const override;
    Result<void> remove(const std::string& key) override;
    [[nodiscard]] bool exists(const std::string& key) const override;
    Result<void> compose(const std::string& destination, const std::vector<std::string>& parts) override;
    Result<std::size_t> remove_prefix(const std::string& prefix) override;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::uint8_t>> objects_;
};

} // namespace edgexfer::transfer
