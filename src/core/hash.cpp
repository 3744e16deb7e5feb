#include "edgexfer/core/hash.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <stdexcept>

namespace edgexfer::core {
namespace fs = std::filesystem;

namespace {

std::string to_hex(const unsigned char* data, std::size_t length) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kHex[(data[i] >> 4) & 0x0F]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

} // namespace

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

void Sha256::update(const void* data, std::size_t length) {
    if (finalized_) {
        throw std::logic_error("Sha256::update after hex_digest");
    }
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256::hex_digest() {
    if (finalized_) {
        throw std::logic_error("Sha256::hex_digest called twice");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finalized_ = true;
    return to_hex(digest, length);
}

std::string sha256_hex(const void* data, std::size_t length) {
    Sha256 hasher;
    hasher.update(data, length);
    return hasher.hex_digest();
}

std::string sha256_hex(std::string_view data) {
    return sha256_hex(data.data(), data.size());
}

std::string sha256_hex(const std::vector<std::uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

Result<std::string> sha256_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Io, "Failed to open file: " + path.string());
    }

    Sha256 hasher;
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        hasher.update(buffer, static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Io, "Failed to read file: " + path.string());
    }
    return Ok(hasher.hex_digest());
}

bool is_sha256_hex(std::string_view text) noexcept {
    if (text.size() != 64) {
        return false;
    }
    for (char c : text) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return true;
}

} // namespace edgexfer::core
