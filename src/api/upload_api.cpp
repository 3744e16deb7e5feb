#include "edgexfer/api/upload_api.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <type_traits>

namespace edgexfer::api {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

json location_to_json(const edge::GeoPoint& point) {
    return json{{"lat", point.lat}, {"lng", point.lng}};
}

json edge_score_to_json(const edge::EdgeScore& scored) {
    return json{{"id", scored.edge.id},
                {"url", scored.edge.url},
                {"city", scored.edge.city},
                {"provider", scored.edge.provider},
                {"latency", scored.metric.latency_ms},
                {"load", scored.metric.load_percent},
                {"bandwidth", scored.metric.bandwidth_mbps},
                {"distance", scored.distance_km},
                {"score", scored.score},
                {"weight", scored.weight}};
}

json edges_to_json(const std::vector<edge::EdgeScore>& edges) {
    json list = json::array();
    for (const auto& scored : edges) {
        list.push_back(edge_score_to_json(scored));
    }
    return list;
}

json duplicate_to_json(const transfer::DuplicateResult& duplicate) {
    return json{{"fileId", duplicate.file_id},
                {"objectKey", duplicate.object_key},
                {"url", duplicate.url},
                {"size", duplicate.record.size},
                {"savedBytes", duplicate.bytes_saved},
                {"savedCost", duplicate.cost_saved}};
}

json chunk_to_json(const session::ChunkRecord& chunk) {
    return json{{"chunkIndex", chunk.index},
                {"chunkHash", chunk.chunk_hash},
                {"edgeId", chunk.edge_id},
                {"status", session::to_string(chunk.status)},
                {"bytesUploaded", chunk.bytes_transferred},
                {"attempts", chunk.attempts},
                {"errorMessage", chunk.error_message},
                {"updatedAt", core::to_unix_millis(chunk.updated_at)}};
}

json session_to_json(const session::UploadSessionRecord& record) {
    json j{{"sessionId", record.session_id},
           {"fileId", record.file_id},
           {"fileName", record.file_name},
           {"fileHash", record.content_hash},
           {"status", session::to_string(record.status)},
           {"fileSize", record.total_size},
           {"chunkSize", record.chunk_size},
           {"chunksTotal", record.total_chunks},
           {"chunksCompleted", record.completed_chunks.size()},
           {"bytesUploaded", record.bytes_uploaded},
           {"generation", record.generation},
           {"expiresAt", core::to_unix_millis(record.expires_at)}};
    if (record.failure_kind) {
        j["failure"] = json{{"kind", to_string(*record.failure_kind)}, {"message", record.failure_message}};
    }
    return j;
}

} // namespace

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpStatus status_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidArgument:
        case ErrorKind::Integrity:
        case ErrorKind::InvalidState:
            return HttpStatus::BAD_REQUEST;
        case ErrorKind::Unauthorized:
            return HttpStatus::UNAUTHORIZED;
        case ErrorKind::Forbidden:
            return HttpStatus::FORBIDDEN;
        case ErrorKind::NotFound:
        case ErrorKind::SessionExpired:
            return HttpStatus::NOT_FOUND;
        case ErrorKind::AlreadyExists:
            return HttpStatus::CONFLICT;
        case ErrorKind::QuotaExceeded:
            return HttpStatus::TOO_MANY_REQUESTS;
        case ErrorKind::NoEdgesAvailable:
            return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorKind::ChunkTransferTimeout:
        case ErrorKind::Cancelled:
        case ErrorKind::Io:
        case ErrorKind::Internal:
            break;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse make_error(const Error& error) {
    const auto status = status_for(error.kind);
    if (status == HttpStatus::INTERNAL_SERVER_ERROR) {
        spdlog::error("Request failed: {}", describe(error));
    }
    return make_json_response(status, json{{"error", to_string(error.kind)}, {"details", error.message}});
}

UploadApi::UploadApi(transfer::TransferOrchestrator& orchestrator,
                     edge::EdgeRegistry& registry,
                     const events::MetricsComponent& metrics,
                     std::unordered_map<std::string, std::string> api_tokens,
                     core::Clock clock)
    : orchestrator_(orchestrator),
      registry_(registry),
      metrics_(metrics),
      api_tokens_(std::move(api_tokens)),
      clock_(std::move(clock)) {}

void UploadApi::register_routes(network::HttpRouter& router) {
    router.use([this](HttpContext& ctx, HttpResponse& response) {
        return authenticate(ctx, response);
    });

    router.post("/optimal-edges", [this](const HttpContext& ctx) { return optimal_edges(ctx); });
    router.post("/check-duplicate", [this](const HttpContext& ctx) { return check_duplicate(ctx); });
    router.post("/cache-chunk", [this](const HttpContext& ctx) { return report_chunk(ctx); });
    router.get("/cache-chunk", [this](const HttpContext& ctx) { return list_chunks(ctx); });
    router.post("/track-upload", [this](const HttpContext& ctx) { return track_upload(ctx); });
    router.post("/resume-upload", [this](const HttpContext& ctx) { return resume_upload(ctx); });
    router.post("/cancel-upload", [this](const HttpContext& ctx) { return cancel_upload(ctx); });
    router.put("/chunks/:sessionId/:index", [this](const HttpContext& ctx) { return put_chunk(ctx); });
    router.get("/dedup-savings", [this](const HttpContext& ctx) { return dedup_savings(ctx); });
    router.post("/edge-metrics", [this](const HttpContext& ctx) { return edge_metrics(ctx); });
    router.get("/edges", [this](const HttpContext& ctx) { return list_edges(ctx); });
    router.get("/stats", [this](const HttpContext& ctx) { return stats(ctx); });
}

bool UploadApi::authenticate(HttpContext& ctx, HttpResponse& response) const {
    static const std::string kBearer = "Bearer ";
    const auto header = ctx.request.get_header("Authorization");
    if (header.compare(0, kBearer.size(), kBearer) != 0) {
        response = make_error(Error{ErrorKind::Unauthorized, "Bearer token required"});
        return false;
    }

    auto it = api_tokens_.find(header.substr(kBearer.size()));
    if (it == api_tokens_.end()) {
        response = make_error(Error{ErrorKind::Unauthorized, "Unknown token"});
        return false;
    }
    ctx.user_id = it->second;
    return true;
}

Result<std::string> UploadApi::resolve_user(const HttpContext& ctx, const std::string& body_user) const {
    if (ctx.user_id.empty()) {
        return Err<std::string>(ErrorKind::Unauthorized, "Bearer token required");
    }
    if (!body_user.empty() && body_user != ctx.user_id) {
        return Err<std::string>(ErrorKind::Forbidden, "userId does not match the authenticated user");
    }
    return Ok(ctx.user_id);
}

// ────────────────────────────────────────────────────────────
// Planning
// ────────────────────────────────────────────────────────────

namespace {

transfer::FileMeta to_file_meta(const std::string& user_id, const OptimalEdgesRequest& request) {
    transfer::FileMeta meta;
    meta.owner_id = user_id;
    meta.file_name = request.file_name;
    meta.content_hash = request.file_hash;
    meta.file_size = request.file_size;
    meta.origin = request.user_location;
    meta.priority = request.priority;
    meta.budget = request.budget;
    return meta;
}

} // namespace

HttpResponse UploadApi::optimal_edges(const HttpContext& ctx) {
    auto body = parse_json_object(ctx.request.body_as_string());
    if (body.is_error()) {
        return make_error(body.error());
    }
    auto request = parse_optimal_edges(body.value());
    if (request.is_error()) {
        return make_error(request.error());
    }
    auto user = resolve_user(ctx, request.value().user_id);
    if (user.is_error()) {
        return make_error(user.error());
    }

    auto recommended = orchestrator_.recommend(to_file_meta(user.value(), request.value()));
    if (recommended.is_error()) {
        return make_error(recommended.error());
    }

    if (const auto* duplicate = std::get_if<transfer::DuplicateResult>(&recommended.value())) {
        return make_json_response(HttpStatus::OK, json{{"strategy", nullptr},
                                                       {"edges", json::array()},
                                                       {"duplicate", duplicate_to_json(*duplicate)}});
    }

    const auto& strategy = std::get<transfer::UploadStrategy>(recommended.value());
    json response{{"strategy", {{"chunkSize", strategy.chunk_plan.chunk_size},
                                {"chunksTotal", strategy.chunk_plan.total_chunks},
                                {"threads", strategy.chunk_plan.parallelism},
                                {"estimatedTime", strategy.estimate.seconds},
                                {"estimatedCost", strategy.estimate.cost},
                                {"priority", edge::to_string(request.value().priority)}}},
                  {"edges", edges_to_json(strategy.edges)},
                  {"duplicate", nullptr}};
    return make_json_response(HttpStatus::OK, response);
}

HttpResponse UploadApi::check_duplicate(const HttpContext& ctx) {
    auto body = parse_json_object(ctx.request.body_as_string());
    if (body.is_error()) {
        return make_error(body.error());
    }
    auto request = parse_check_duplicate(body.value());
    if (request.is_error()) {
        return make_error(request.error());
    }
    auto user = resolve_user(ctx, request.value().user_id);
    if (user.is_error()) {
        return make_error(user.error());
    }

    auto found = orchestrator_.check_duplicate(request.value().file_hash, user.value(), request.value().file_size);
    if (found.is_error()) {
        return make_error(found.error());
    }
    if (!found.value()) {
        return make_json_response(HttpStatus::OK, json{{"isDuplicate", false}});
    }

    const auto& duplicate = *found.value();
    return make_json_response(HttpStatus::OK,
                              json{{"isDuplicate", true},
                                   {"file", duplicate_to_json(duplicate)},
                                   {"savings", {{"bytes", duplicate.bytes_saved}, {"cost", duplicate.cost_saved}}}});
}

// ────────────────────────────────────────────────────────────
// Chunks
// ────────────────────────────────────────────────────────────

HttpResponse UploadApi::report_chunk(const HttpContext& ctx) {
    auto body = parse_json_object(ctx.request.body_as_string());
    if (body.is_error()) {
        return make_error(body.error());
    }
    auto request = parse_cache_chunk(body.value());
    if (request.is_error()) {
        return make_error(request.error());
    }
    auto user = resolve_user(ctx, request.value().user_id);
    if (user.is_error()) {
        return make_error(user.error());
    }

    const auto& report = request.value();
    session::ChunkRecord chunk;
    chunk.session_id = report.session_id;
    chunk.index = report.chunk_index;
    chunk.chunk_hash = report.chunk_hash;
    chunk.edge_id = report.edge_id;
    chunk.status = report.status;
    chunk.bytes_transferred = report.bytes_uploaded;
    chunk.error_message = report.error_message;

    auto updated = orchestrator_.record_chunk(user.value(), std::move(chunk));
    if (updated.is_error()) {
        return make_error(updated.error());
    }

    const auto& record = updated.value();
    auto it = record.chunks.find(report.chunk_index);
    const char* status = it != record.chunks.end() ? session::to_string(it->second.status)
                                                   : session::to_string(report.status);
    return make_json_response(HttpStatus::OK,
                              json{{"success", true},
                                   {"chunk", {{"sessionId", record.session_id},
                                              {"chunkIndex", report.chunk_index},
                                              {"status", status}}},
                                   {"session", {{"status", session::to_string(record.status)},
                                                {"chunksCompleted", record.completed_chunks.size()},
                                                {"chunksTotal", record.total_chunks}}}});
}

HttpResponse UploadApi::list_chunks(const HttpContext& ctx) {
    const auto session_id = ctx.get_query("sessionId");
    if (session_id.empty()) {
        return make_error(Error{ErrorKind::InvalidArgument, "sessionId is required"});
    }
    auto user = resolve_user(ctx, ctx.get_query("userId"));
    if (user.is_error()) {
        return make_error(user.error());
    }

    auto record = orchestrator_.get_session(session_id, user.value());
    if (record.is_error()) {
        return make_error(record.error());
    }

    json chunks = json::array();
    for (const auto& [index, chunk] : record.value().chunks) {
        chunks.push_back(chunk_to_json(chunk));
    }
    return make_json_response(HttpStatus::OK,
                              json{{"sessionId", session_id},
                                   {"status", session::to_string(record.value().status)},
                                   {"chunks", std::move(chunks)},
                                   {"completed", record.value().completed_chunks.size()},
                                   {"total", record.value().total_chunks}});
}

HttpResponse UploadApi::put_chunk(const HttpContext& ctx) {
    const auto session_id = ctx.get_param("sessionId");
    const auto index_text = ctx.get_param("index");

    std::uint32_t index = 0;
    const auto* first = index_text.data();
    const auto* last = first + index_text.size();
    auto [end, ec] = std::from_chars(first, last, index);
    if (index_text.empty() || ec != std::errc() || end != last) {
        return make_error(Error{ErrorKind::InvalidArgument, "Chunk index must be a non-negative integer"});
    }

    auto user = resolve_user(ctx, ctx.get_query("userId"));
    if (user.is_error()) {
        return make_error(user.error());
    }

    auto accepted = orchestrator_.accept_chunk_data(session_id, user.value(), index, ctx.request.body);
    if (accepted.is_error()) {
        return make_error(accepted.error());
    }
    return make_json_response(HttpStatus::OK,
                              json{{"success", true},
                                   {"chunkIndex", index},
                                   {"session", session_to_json(accepted.value())}});
}

// ────────────────────────────────────────────────────────────
// Session lifecycle
// ────────────────────────────────────────────────────────────

HttpResponse UploadApi::start_upload(const std::string& user_id, const StartUploadAction& action) {
    auto started = orchestrator_.start_upload(to_file_meta(user_id, action.file));
    if (started.is_error()) {
        return make_error(started.error());
    }

    if (const auto* duplicate = std::get_if<transfer::DuplicateResult>(&started.value())) {
        return make_json_response(HttpStatus::OK,
                                  json{{"success", true},
                                       {"isDuplicate", true},
                                       {"file", duplicate_to_json(*duplicate)},
                                       {"savings", {{"bytes", duplicate->bytes_saved},
                                                    {"cost", duplicate->cost_saved}}}});
    }

    const auto& plan = std::get<transfer::UploadPlan>(started.value());
    return make_json_response(HttpStatus::CREATED,
                              json{{"success", true},
                                   {"isDuplicate", false},
                                   {"sessionId", plan.session.session_id},
                                   {"fileId", plan.session.file_id},
                                   {"chunkSize", plan.session.chunk_size},
                                   {"chunksTotal", plan.session.total_chunks},
                                   {"threads", plan.session.parallelism},
                                   {"estimatedTime", plan.strategy.estimate.seconds},
                                   {"estimatedCost", plan.strategy.estimate.cost},
                                   {"directFallback", plan.strategy.direct_fallback},
                                   {"edges", edges_to_json(plan.strategy.edges)},
                                   {"expiresAt", core::to_unix_millis(plan.session.expires_at)}});
}

HttpResponse UploadApi::track_upload(const HttpContext& ctx) {
    auto body = parse_json_object(ctx.request.body_as_string());
    if (body.is_error()) {
        return make_error(body.error());
    }
    auto request = parse_track_upload(body.value());
    if (request.is_error()) {
        return make_error(request.error());
    }
    auto user = resolve_user(ctx, request.value().user_id);
    if (user.is_error()) {
        return make_error(user.error());
    }
    const auto& user_id = user.value();

    return std::visit([&](const auto& action) -> HttpResponse {
        using Action = std::decay_t<decltype(action)>;

        if constexpr (std::is_same_v<Action, StartUploadAction>) {
            return start_upload(user_id, action);
        } else if constexpr (std::is_same_v<Action, ProgressAction>) {
            auto updated = orchestrator_.update_progress(action.session_id, user_id,
                                                         action.chunks_completed, action.bytes_uploaded);
            if (updated.is_error()) {
                return make_error(updated.error());
            }
            return make_json_response(HttpStatus::OK,
                                      json{{"success", true}, {"session", session_to_json(updated.value())}});
        } else if constexpr (std::is_same_v<Action, CompleteAction>) {
            auto finalized = orchestrator_.finalize(action.session_id, user_id);
            if (finalized.is_error()) {
                return make_error(finalized.error());
            }
            const auto& record = finalized.value();
            json response{{"success", true}, {"session", session_to_json(record)}};
            if (auto content = orchestrator_.find_content(record.content_hash)) {
                response["objectKey"] = content->object_key;
                response["url"] = orchestrator_.object_url(content->object_key);
            }
            return make_json_response(HttpStatus::OK, response);
        } else {
            auto failed = orchestrator_.fail_upload(action.session_id, user_id, ErrorKind::Io, action.error_message);
            if (failed.is_error()) {
                return make_error(failed.error());
            }
            return make_json_response(HttpStatus::OK,
                                      json{{"success", true}, {"session", session_to_json(failed.value())}});
        }
    }, request.value().action);
}

HttpResponse UploadApi::resume_upload(const HttpContext& ctx) {
    auto body = parse_json_object(ctx.request.body_as_string());
    if (body.is_error()) {
        return make_error(body.error());
    }
    auto request = parse_session_request(body.value());
    if (request.is_error()) {
        return make_error(request.error());
    }
    auto user = resolve_user(ctx, request.value().user_id);
    if (user.is_error()) {
        return make_error(user.error());
    }

    auto resumed = orchestrator_.resume_upload(request.value().session_id, user.value());
    if (resumed.is_error()) {
        return make_error(resumed.error());
    }

    const auto& plan = resumed.value();
    return make_json_response(HttpStatus::OK,
                              json{{"success", true},
                                   {"session", session_to_json(plan.session)},
                                   {"incompleteChunks", plan.incomplete_chunks},
                                   {"edges", edges_to_json(plan.edges)},
                                   {"directFallback", plan.direct_fallback}});
}

HttpResponse UploadApi::cancel_upload(const HttpContext& ctx) {
    auto body = parse_json_object(ctx.request.body_as_string());
    if (body.is_error()) {
        return make_error(body.error());
    }
    auto request = parse_session_request(body.value());
    if (request.is_error()) {
        return make_error(request.error());
    }
    auto user = resolve_user(ctx, request.value().user_id);
    if (user.is_error()) {
        return make_error(user.error());
    }

    auto cancelled = orchestrator_.cancel_upload(request.value().session_id, user.value());
    if (cancelled.is_error()) {
        return make_error(cancelled.error());
    }
    return make_json_response(HttpStatus::OK,
                              json{{"success", true}, {"session", session_to_json(cancelled.value())}});
}

// ────────────────────────────────────────────────────────────
// Fleet and reporting
// ────────────────────────────────────────────────────────────

HttpResponse UploadApi::dedup_savings(const HttpContext&) {
    const auto savings = orchestrator_.dedup_savings();
    return make_json_response(HttpStatus::OK,
                              json{{"uniqueObjects", savings.unique_objects},
                                   {"filesDeduplicated", savings.deduplicated_objects},
                                   {"duplicateUploadsSaved", savings.duplicate_hits},
                                   {"bytesSaved", savings.bytes_saved},
                                   {"costSaved", savings.cost_saved}});
}

HttpResponse UploadApi::edge_metrics(const HttpContext& ctx) {
    auto body = parse_json_object(ctx.request.body_as_string());
    if (body.is_error()) {
        return make_error(body.error());
    }
    auto request = parse_edge_metrics(body.value());
    if (request.is_error()) {
        return make_error(request.error());
    }

    edge::EdgeMetric metric;
    metric.edge_id = request.value().edge_id;
    metric.timestamp = clock_();
    metric.latency_ms = request.value().latency_ms;
    metric.load_percent = request.value().load_percent;
    metric.bandwidth_mbps = request.value().bandwidth_mbps;
    metric.active_uploads = request.value().active_uploads;
    metric.error_rate = request.value().error_rate;

    if (auto recorded = registry_.record_metric(metric); recorded.is_error()) {
        return make_error(recorded.error());
    }
    return make_json_response(HttpStatus::OK,
                              json{{"success", true},
                                   {"edgeId", metric.edge_id},
                                   {"timestamp", core::to_unix_millis(metric.timestamp)}});
}

HttpResponse UploadApi::list_edges(const HttpContext&) {
    json edges = json::array();
    for (const auto& snapshot : registry_.snapshot()) {
        json entry{{"id", snapshot.edge.id},
                   {"url", snapshot.edge.url},
                   {"city", snapshot.edge.city},
                   {"country", snapshot.edge.country},
                   {"provider", snapshot.edge.provider},
                   {"location", location_to_json(snapshot.edge.location)},
                   {"active", snapshot.edge.active},
                   {"metrics", nullptr}};
        if (snapshot.latest) {
            const auto& m = *snapshot.latest;
            entry["metrics"] = json{{"latencyMs", m.latency_ms},
                                    {"loadPercent", m.load_percent},
                                    {"bandwidthMbps", m.bandwidth_mbps},
                                    {"activeUploads", m.active_uploads},
                                    {"errorRate", m.error_rate},
                                    {"timestamp", core::to_unix_millis(m.timestamp)}};
        }
        edges.push_back(std::move(entry));
    }
    const auto total = edges.size();
    return make_json_response(HttpStatus::OK, json{{"edges", std::move(edges)}, {"total", total}});
}

HttpResponse UploadApi::stats(const HttpContext&) {
    const auto& s = metrics_.get_stats();
    const auto savings = orchestrator_.dedup_savings();
    return make_json_response(HttpStatus::OK,
                              json{{"uploads", {{"planned", s.uploads_planned.load()},
                                                {"completed", s.uploads_completed.load()},
                                                {"failed", s.uploads_failed.load()},
                                                {"cancelled", s.uploads_cancelled.load()},
                                                {"expired", s.sessions_expired.load()},
                                                {"resumed", s.sessions_resumed.load()},
                                                {"bytes", s.bytes_uploaded.load()}}},
                                   {"chunks", {{"completed", s.chunks_completed.load()},
                                               {"retried", s.chunks_retried.load()},
                                               {"timeouts", s.chunk_timeouts.load()}}},
                                   {"dedup", {{"duplicates", s.duplicates_detected.load()},
                                              {"bytesSaved", savings.bytes_saved},
                                              {"costSaved", savings.cost_saved}}}});
}

} // namespace edgexfer::api
