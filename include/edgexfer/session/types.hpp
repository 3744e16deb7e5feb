#pragma once

#include "edgexfer/core/clock.hpp"
#include "edgexfer/core/error.hpp"
#include "edgexfer/edge/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace edgexfer::session {

enum class UploadStatus {
    Planned,
    Uploading,
    Verifying,
    Completed,
    Failed
};

enum class ChunkStatus {
    Pending,
    Uploading,
    Completed,
    Failed
};

const char* to_string(UploadStatus status) noexcept;
const char* to_string(ChunkStatus status) noexcept;
std::optional<UploadStatus> upload_status_from_string(std::string_view text) noexcept;
std::optional<ChunkStatus> chunk_status_from_string(std::string_view text) noexcept;

[[nodiscard]] inline bool is_terminal(UploadStatus status) noexcept {
    return status == UploadStatus::Completed || status == UploadStatus::Failed;
}

/**
 * @brief Progress of one chunk inside a session
 */
struct ChunkRecord {
    std::string session_id;
    std::uint32_t index = 0;
    std::string chunk_hash;
    std::string edge_id;
    ChunkStatus status = ChunkStatus::Pending;
    std::uint64_t bytes_transferred = 0;
    std::uint32_t attempts = 0;
    std::string error_message;
    core::TimePoint updated_at{};
};

struct EdgeAssignment {
    std::string edge_id;
    std::string url;
    double weight = 0.0;
};

/**
 * @brief Durable state of one in-flight upload
 *
 * `completed_chunks` is a set so completions may land in any order.
 * `generation` increases whenever a cancelled session is reopened.
 */
struct UploadSessionRecord {
    std::string session_id;
    std::string owner_id;
    std::string file_id;
    std::string file_name;
    std::string content_hash;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t parallelism = 1;
    edge::Priority priority = edge::Priority::Balanced;
    edge::GeoPoint origin;
    std::set<std::uint32_t> completed_chunks;
    std::map<std::uint32_t, ChunkRecord> chunks;
    std::vector<EdgeAssignment> assigned_edges;
    UploadStatus status = UploadStatus::Planned;
    std::optional<ErrorKind> failure_kind;
    std::string failure_message;
    std::uint64_t bytes_uploaded = 0;
    std::uint32_t generation = 1;
    core::TimePoint created_at{};
    core::TimePoint updated_at{};
    core::TimePoint expires_at{};

    [[nodiscard]] bool all_chunks_completed() const noexcept {
        return completed_chunks.size() == total_chunks;
    }

    [[nodiscard]] std::vector<std::uint32_t> incomplete_chunks() const;
};

} // namespace edgexfer::session
