#pragma once

#include "edgexfer/core/result.hpp"
#include "edgexfer/edge/types.hpp"
#include "edgexfer/session/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace edgexfer::api {

using json = nlohmann::json;

/**
 * @brief Request bodies after validation
 *
 * Handlers only ever see these structs; every field has been type checked
 * and range checked by the matching parse_* function. Content hashes are
 * normalized to bare lowercase hex (an optional "sha256:" prefix is
 * stripped).
 */

struct OptimalEdgesRequest {
    std::string user_id;
    std::uint64_t file_size = 0;
    std::string file_hash;
    std::string file_name;
    std::optional<edge::GeoPoint> user_location;
    edge::Priority priority = edge::Priority::Balanced;
    std::optional<double> budget;
};

struct CheckDuplicateRequest {
    std::string file_hash;
    std::string user_id;
    std::string file_name;
    std::uint64_t file_size = 0;
};

struct CacheChunkRequest {
    std::string user_id;
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::string chunk_hash;
    std::string edge_id;
    session::ChunkStatus status = session::ChunkStatus::Pending;
    std::uint64_t bytes_uploaded = 0;
    std::string error_message;
};

struct StartUploadAction {
    OptimalEdgesRequest file;
};

struct ProgressAction {
    std::string session_id;
    std::uint32_t chunks_completed = 0;
    std::uint64_t bytes_uploaded = 0;
};

struct CompleteAction {
    std::string session_id;
};

struct FailAction {
    std::string session_id;
    std::string error_message;
};

using TrackUploadAction = std::variant<StartUploadAction, ProgressAction, CompleteAction, FailAction>;

struct TrackUploadRequest {
    std::string user_id;
    TrackUploadAction action;
};

struct EdgeMetricsRequest {
    std::string edge_id;
    double latency_ms = 0.0;
    double load_percent = 0.0;
    double bandwidth_mbps = 0.0;
    std::uint32_t active_uploads = 0;
    double error_rate = 0.0;
};

/// Body of resume-upload and cancel-upload.
struct SessionRequest {
    std::string user_id;
    std::string session_id;
};

/// Parses a body as a JSON object; anything else is InvalidArgument.
Result<json> parse_json_object(const std::string& body);

/// Strips an optional "sha256:" prefix and lowercases; validates 64 hex digits.
Result<std::string> normalize_hash(const std::string& text);

Result<OptimalEdgesRequest> parse_optimal_edges(const json& body);
Result<CheckDuplicateRequest> parse_check_duplicate(const json& body);
Result<CacheChunkRequest> parse_cache_chunk(const json& body);
Result<TrackUploadRequest> parse_track_upload(const json& body);
Result<EdgeMetricsRequest> parse_edge_metrics(const json& body);
Result<SessionRequest> parse_session_request(const json& body);

} // namespace edgexfer::api
