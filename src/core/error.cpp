#include "edgexfer/core/error.hpp"

#include <array>
#include <utility>

namespace edgexfer {
namespace {

constexpr std::array<std::pair<ErrorKind, const char*>, 14> kNames{{
    {ErrorKind::InvalidArgument, "invalid_argument"},
    {ErrorKind::NotFound, "not_found"},
    {ErrorKind::AlreadyExists, "already_exists"},
    {ErrorKind::Unauthorized, "unauthorized"},
    {ErrorKind::Forbidden, "forbidden"},
    {ErrorKind::InvalidState, "invalid_state"},
    {ErrorKind::NoEdgesAvailable, "no_edges_available"},
    {ErrorKind::Integrity, "integrity"},
    {ErrorKind::QuotaExceeded, "quota_exceeded"},
    {ErrorKind::ChunkTransferTimeout, "chunk_transfer_timeout"},
    {ErrorKind::SessionExpired, "session_expired"},
    {ErrorKind::Cancelled, "cancelled"},
    {ErrorKind::Io, "io"},
    {ErrorKind::Internal, "internal"},
}};

} // namespace

const char* to_string(ErrorKind kind) noexcept {
    for (const auto& [value, name] : kNames) {
        if (value == kind) {
            return name;
        }
    }
    return "internal";
}

std::optional<ErrorKind> error_kind_from_string(std::string_view text) noexcept {
    for (const auto& [value, name] : kNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace edgexfer
