#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace edgexfer {

/**
 * @brief Failure taxonomy shared by every module
 *
 * Upload-level kinds (NoEdgesAvailable .. SessionExpired) are reported to
 * callers unchanged; the rest describe request or storage problems.
 */
enum class ErrorKind {
    InvalidArgument,
    NotFound,
    AlreadyExists,
    Unauthorized,
    Forbidden,
    InvalidState,
    NoEdgesAvailable,
    Integrity,
    QuotaExceeded,
    ChunkTransferTimeout,
    SessionExpired,
    Cancelled,
    Io,
    Internal
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

const char* to_string(ErrorKind kind) noexcept;

std::optional<ErrorKind> error_kind_from_string(std::string_view text) noexcept;

inline std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace edgexfer
