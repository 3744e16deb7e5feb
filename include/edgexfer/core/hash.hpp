#pragma once

#include "edgexfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace edgexfer::core {

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface
 *
 * Content hashes throughout the system are 64 lowercase hex characters.
 * A hasher is single-use: hex_digest() finalizes it.
 */
class Sha256 {
public:
    Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept = default;
    Sha256& operator=(Sha256&&) noexcept = default;

    void update(const void* data, std::size_t length);
    void update(std::string_view data) { update(data.data(), data.size()); }
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }

    std::string hex_digest();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_ = false;
};

std::string sha256_hex(const void* data, std::size_t length);
std::string sha256_hex(std::string_view data);
std::string sha256_hex(const std::vector<std::uint8_t>& data);

Result<std::string> sha256_file(const std::filesystem::path& path);

[[nodiscard]] bool is_sha256_hex(std::string_view text) noexcept;

} // namespace edgexfer::core
