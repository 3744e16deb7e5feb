#include "edgexfer/session/types.hpp"

#include <algorithm>

namespace edgexfer::session {

const char* to_string(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Planned: return "planned";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Verifying: return "verifying";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
    }
    return "failed";
}

const char* to_string(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::Uploading: return "uploading";
        case ChunkStatus::Completed: return "completed";
        case ChunkStatus::Failed: return "failed";
    }
    return "failed";
}

std::optional<UploadStatus> upload_status_from_string(std::string_view text) noexcept {
    if (text == "planned") return UploadStatus::Planned;
    if (text == "uploading") return UploadStatus::Uploading;
    if (text == "verifying") return UploadStatus::Verifying;
    if (text == "completed") return UploadStatus::Completed;
    if (text == "failed") return UploadStatus::Failed;
    return std::nullopt;
}

std::optional<ChunkStatus> chunk_status_from_string(std::string_view text) noexcept {
    if (text == "pending") return ChunkStatus::Pending;
    if (text == "uploading") return ChunkStatus::Uploading;
    if (text == "completed") return ChunkStatus::Completed;
    if (text == "failed") return ChunkStatus::Failed;
    return std::nullopt;
}

std::vector<std::uint32_t> UploadSessionRecord::incomplete_chunks() const {
    std::vector<std::uint32_t> missing;
    missing.reserve(total_chunks - std::min<std::size_t>(total_chunks, completed_chunks.size()));
    for (std::uint32_t i = 0; i < total_chunks; ++i) {
        if (completed_chunks.count(i) == 0) {
            missing.push_back(i);
        }
    }
    return missing;
}

} // namespace edgexfer::session
