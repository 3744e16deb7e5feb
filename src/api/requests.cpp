#include "edgexfer/api/requests.hpp"

#include "edgexfer/core/hash.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace edgexfer::api {
namespace {

Result<std::string> required_string(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Err<std::string>(ErrorKind::InvalidArgument, std::string(key) + " is required");
    }
    return Ok(it->get<std::string>());
}

Result<std::string> optional_string(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Ok(std::string{});
    }
    if (!it->is_string()) {
        return Err<std::string>(ErrorKind::InvalidArgument, std::string(key) + " must be a string");
    }
    return Ok(it->get<std::string>());
}

Result<std::uint64_t> unsigned_field(const json& value, const char* key) {
    if (value.is_number_unsigned()) {
        return Ok(value.get<std::uint64_t>());
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return Ok(static_cast<std::uint64_t>(value.get<std::int64_t>()));
    }
    return Err<std::uint64_t>(ErrorKind::InvalidArgument, std::string(key) + " must be a non-negative integer");
}

Result<std::uint64_t> required_unsigned(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Err<std::uint64_t>(ErrorKind::InvalidArgument, std::string(key) + " is required");
    }
    return unsigned_field(*it, key);
}

Result<std::uint64_t> optional_unsigned(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Ok(std::uint64_t{0});
    }
    return unsigned_field(*it, key);
}

Result<std::uint32_t> required_index(const json& body, const char* key) {
    auto value = required_unsigned(body, key);
    if (value.is_error()) {
        return Err<std::uint32_t>(value.error());
    }
    if (value.value() > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::uint32_t>(ErrorKind::InvalidArgument, std::string(key) + " is out of range");
    }
    return Ok(static_cast<std::uint32_t>(value.value()));
}

Result<std::optional<double>> optional_number(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return Ok(std::optional<double>{});
    }
    if (!it->is_number() || !std::isfinite(it->get<double>())) {
        return Err<std::optional<double>>(ErrorKind::InvalidArgument, std::string(key) + " must be a number");
    }
    return Ok(std::optional<double>(it->get<double>()));
}

Result<double> metric_value(const json& body, const char* key, bool required) {
    auto value = optional_number(body, key);
    if (value.is_error()) {
        return Err<double>(value.error());
    }
    if (!value.value()) {
        if (required) {
            return Err<double>(ErrorKind::InvalidArgument, std::string(key) + " is required");
        }
        return Ok(0.0);
    }
    if (*value.value() < 0.0) {
        return Err<double>(ErrorKind::InvalidArgument, std::string(key) + " must not be negative");
    }
    return Ok(*value.value());
}

Result<std::optional<edge::GeoPoint>> parse_location(const json& body) {
    auto it = body.find("userLocation");
    if (it == body.end() || it->is_null()) {
        return Ok(std::optional<edge::GeoPoint>{});
    }
    if (!it->is_object()) {
        return Err<std::optional<edge::GeoPoint>>(ErrorKind::InvalidArgument, "userLocation must be an object");
    }

    auto lat = optional_number(*it, "lat");
    auto lng = optional_number(*it, "lng");
    if (lat.is_error() || lng.is_error() || !lat.value() || !lng.value()) {
        return Err<std::optional<edge::GeoPoint>>(ErrorKind::InvalidArgument,
                                                  "userLocation needs numeric lat and lng");
    }
    const double la = *lat.value();
    const double ln = *lng.value();
    if (la < -90.0 || la > 90.0 || ln < -180.0 || ln > 180.0) {
        return Err<std::optional<edge::GeoPoint>>(ErrorKind::InvalidArgument, "userLocation is out of range");
    }
    return Ok(std::optional<edge::GeoPoint>(edge::GeoPoint{la, ln}));
}

Result<std::string> optional_user(const json& body) {
    return optional_string(body, "userId");
}

} // namespace

Result<json> parse_json_object(const std::string& body) {
    auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<json>(ErrorKind::InvalidArgument, "Invalid JSON");
    }
    if (!parsed.is_object()) {
        return Err<json>(ErrorKind::InvalidArgument, "Request body must be a JSON object");
    }
    return Ok(std::move(parsed));
}

Result<std::string> normalize_hash(const std::string& text) {
    std::string hash = text;
    constexpr const char* kPrefix = "sha256:";
    if (hash.compare(0, 7, kPrefix) == 0) {
        hash.erase(0, 7);
    }
    std::transform(hash.begin(), hash.end(), hash.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!core::is_sha256_hex(hash)) {
        return Err<std::string>(ErrorKind::InvalidArgument, "Hash must be a SHA-256 hex digest");
    }
    return Ok(std::move(hash));
}

Result<OptimalEdgesRequest> parse_optimal_edges(const json& body) {
    OptimalEdgesRequest request;

    auto user = optional_user(body);
    if (user.is_error()) {
        return Err<OptimalEdgesRequest>(user.error());
    }
    request.user_id = std::move(user.value());

    auto size = required_unsigned(body, "fileSize");
    if (size.is_error()) {
        return Err<OptimalEdgesRequest>(size.error());
    }
    if (size.value() == 0) {
        return Err<OptimalEdgesRequest>(ErrorKind::InvalidArgument, "fileSize must be greater than zero");
    }
    request.file_size = size.value();

    auto raw_hash = required_string(body, "fileHash");
    if (raw_hash.is_error()) {
        return Err<OptimalEdgesRequest>(raw_hash.error());
    }
    auto hash = normalize_hash(raw_hash.value());
    if (hash.is_error()) {
        return Err<OptimalEdgesRequest>(hash.error());
    }
    request.file_hash = std::move(hash.value());

    auto name = optional_string(body, "fileName");
    if (name.is_error()) {
        return Err<OptimalEdgesRequest>(name.error());
    }
    request.file_name = std::move(name.value());

    auto location = parse_location(body);
    if (location.is_error()) {
        return Err<OptimalEdgesRequest>(location.error());
    }
    request.user_location = location.value();

    auto priority = optional_string(body, "priority");
    if (priority.is_error()) {
        return Err<OptimalEdgesRequest>(priority.error());
    }
    if (!priority.value().empty()) {
        auto parsed = edge::priority_from_string(priority.value());
        if (!parsed) {
            return Err<OptimalEdgesRequest>(ErrorKind::InvalidArgument,
                                            "priority must be one of speed, cost, balanced");
        }
        request.priority = *parsed;
    }

    auto budget = optional_number(body, "budget");
    if (budget.is_error()) {
        return Err<OptimalEdgesRequest>(budget.error());
    }
    if (budget.value() && *budget.value() < 0.0) {
        return Err<OptimalEdgesRequest>(ErrorKind::InvalidArgument, "budget must not be negative");
    }
    request.budget = budget.value();

    return Ok(std::move(request));
}

Result<CheckDuplicateRequest> parse_check_duplicate(const json& body) {
    CheckDuplicateRequest request;

    auto raw_hash = required_string(body, "fileHash");
    if (raw_hash.is_error()) {
        return Err<CheckDuplicateRequest>(raw_hash.error());
    }
    auto hash = normalize_hash(raw_hash.value());
    if (hash.is_error()) {
        return Err<CheckDuplicateRequest>(hash.error());
    }
    request.file_hash = std::move(hash.value());

    auto user = optional_user(body);
    auto name = optional_string(body, "fileName");
    auto size = optional_unsigned(body, "fileSize");
    if (user.is_error()) {
        return Err<CheckDuplicateRequest>(user.error());
    }
    if (name.is_error()) {
        return Err<CheckDuplicateRequest>(name.error());
    }
    if (size.is_error()) {
        return Err<CheckDuplicateRequest>(size.error());
    }
    request.user_id = std::move(user.value());
    request.file_name = std::move(name.value());
    request.file_size = size.value();
    return Ok(std::move(request));
}

Result<CacheChunkRequest> parse_cache_chunk(const json& body) {
    CacheChunkRequest request;

    auto session_id = required_string(body, "sessionId");
    if (session_id.is_error()) {
        return Err<CacheChunkRequest>(session_id.error());
    }
    request.session_id = std::move(session_id.value());

    auto index = required_index(body, "chunkIndex");
    if (index.is_error()) {
        return Err<CacheChunkRequest>(index.error());
    }
    request.chunk_index = index.value();

    auto status_text = required_string(body, "status");
    if (status_text.is_error()) {
        return Err<CacheChunkRequest>(status_text.error());
    }
    auto status = session::chunk_status_from_string(status_text.value());
    if (!status) {
        return Err<CacheChunkRequest>(ErrorKind::InvalidArgument,
                                      "status must be one of pending, uploading, completed, failed");
    }
    request.status = *status;

    auto chunk_hash = optional_string(body, "chunkHash");
    if (chunk_hash.is_error()) {
        return Err<CacheChunkRequest>(chunk_hash.error());
    }
    if (!chunk_hash.value().empty()) {
        auto normalized = normalize_hash(chunk_hash.value());
        if (normalized.is_error()) {
            return Err<CacheChunkRequest>(normalized.error());
        }
        request.chunk_hash = std::move(normalized.value());
    }
    if (request.status == session::ChunkStatus::Completed && request.chunk_hash.empty()) {
        return Err<CacheChunkRequest>(ErrorKind::InvalidArgument, "chunkHash is required for a completed chunk");
    }

    auto user = optional_user(body);
    auto edge_id = optional_string(body, "edgeId");
    auto bytes = optional_unsigned(body, "bytesUploaded");
    auto message = optional_string(body, "errorMessage");
    if (user.is_error()) {
        return Err<CacheChunkRequest>(user.error());
    }
    if (edge_id.is_error()) {
        return Err<CacheChunkRequest>(edge_id.error());
    }
    if (bytes.is_error()) {
        return Err<CacheChunkRequest>(bytes.error());
    }
    if (message.is_error()) {
        return Err<CacheChunkRequest>(message.error());
    }
    request.user_id = std::move(user.value());
    request.edge_id = std::move(edge_id.value());
    request.bytes_uploaded = bytes.value();
    request.error_message = std::move(message.value());
    return Ok(std::move(request));
}

Result<TrackUploadRequest> parse_track_upload(const json& body) {
    auto action = required_string(body, "action");
    if (action.is_error()) {
        return Err<TrackUploadRequest>(action.error());
    }

    TrackUploadRequest request;
    auto user = optional_user(body);
    if (user.is_error()) {
        return Err<TrackUploadRequest>(user.error());
    }
    request.user_id = std::move(user.value());

    if (action.value() == "start") {
        auto file = parse_optimal_edges(body);
        if (file.is_error()) {
            return Err<TrackUploadRequest>(file.error());
        }
        request.action = StartUploadAction{std::move(file.value())};
        return Ok(std::move(request));
    }

    auto session_id = required_string(body, "sessionId");
    if (session_id.is_error()) {
        return Err<TrackUploadRequest>(session_id.error());
    }

    if (action.value() == "progress") {
        auto chunks = optional_unsigned(body, "chunksCompleted");
        auto bytes = optional_unsigned(body, "bytesUploaded");
        if (chunks.is_error()) {
            return Err<TrackUploadRequest>(chunks.error());
        }
        if (bytes.is_error()) {
            return Err<TrackUploadRequest>(bytes.error());
        }
        if (chunks.value() > std::numeric_limits<std::uint32_t>::max()) {
            return Err<TrackUploadRequest>(ErrorKind::InvalidArgument, "chunksCompleted is out of range");
        }
        request.action = ProgressAction{std::move(session_id.value()),
                                        static_cast<std::uint32_t>(chunks.value()), bytes.value()};
    } else if (action.value() == "complete") {
        request.action = CompleteAction{std::move(session_id.value())};
    } else if (action.value() == "fail") {
        auto message = optional_string(body, "errorMessage");
        if (message.is_error()) {
            return Err<TrackUploadRequest>(message.error());
        }
        std::string reason = message.value().empty() ? "Client reported failure" : message.value();
        request.action = FailAction{std::move(session_id.value()), std::move(reason)};
    } else {
        return Err<TrackUploadRequest>(ErrorKind::InvalidArgument,
                                       "action must be one of start, progress, complete, fail");
    }
    return Ok(std::move(request));
}

Result<EdgeMetricsRequest> parse_edge_metrics(const json& body) {
    EdgeMetricsRequest request;

    auto edge_id = required_string(body, "edgeId");
    if (edge_id.is_error()) {
        return Err<EdgeMetricsRequest>(edge_id.error());
    }
    request.edge_id = std::move(edge_id.value());

    auto latency = metric_value(body, "latencyMs", true);
    auto load = metric_value(body, "loadPercent", true);
    auto bandwidth = metric_value(body, "bandwidthMbps", true);
    auto errors = metric_value(body, "errorRate", false);
    auto uploads = optional_unsigned(body, "activeUploads");
    for (const auto* failed : {&latency, &load, &bandwidth, &errors}) {
        if (failed->is_error()) {
            return Err<EdgeMetricsRequest>(failed->error());
        }
    }
    if (uploads.is_error()) {
        return Err<EdgeMetricsRequest>(uploads.error());
    }
    if (load.value() > 100.0 || errors.value() > 100.0) {
        return Err<EdgeMetricsRequest>(ErrorKind::InvalidArgument, "Percentages must not exceed 100");
    }
    if (uploads.value() > std::numeric_limits<std::uint32_t>::max()) {
        return Err<EdgeMetricsRequest>(ErrorKind::InvalidArgument, "activeUploads is out of range");
    }

    request.latency_ms = latency.value();
    request.load_percent = load.value();
    request.bandwidth_mbps = bandwidth.value();
    request.error_rate = errors.value();
    request.active_uploads = static_cast<std::uint32_t>(uploads.value());
    return Ok(std::move(request));
}

Result<SessionRequest> parse_session_request(const json& body) {
    auto session_id = required_string(body, "sessionId");
    if (session_id.is_error()) {
        return Err<SessionRequest>(session_id.error());
    }
    auto user = optional_user(body);
    if (user.is_error()) {
        return Err<SessionRequest>(user.error());
    }
    return Ok(SessionRequest{std::move(user.value()), std::move(session_id.value())});
}

} // namespace edgexfer::api
