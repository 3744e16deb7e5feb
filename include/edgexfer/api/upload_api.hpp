#pragma once

#include "edgexfer/api/requests.hpp"
#include "edgexfer/core/clock.hpp"
#include "edgexfer/core/error.hpp"
#include "edgexfer/dedup/index.hpp"
#include "edgexfer/edge/registry.hpp"
#include "edgexfer/events/components.hpp"
#include "edgexfer/network/http_router.hpp"
#include "edgexfer/network/http_types.hpp"
#include "edgexfer/transfer/orchestrator.hpp"

#include <string>
#include <unordered_map>

namespace edgexfer::api {

network::HttpResponse make_json_response(network::HttpStatus status, const json& body);

/// `{error, details}` body with the status matching the error kind.
network::HttpResponse make_error(const Error& error);

network::HttpStatus status_for(ErrorKind kind) noexcept;

/**
 * @brief HTTP surface of the upload service
 *
 * Routes:
 *   POST /optimal-edges          strategy or duplicate for a file
 *   POST /check-duplicate        dedup lookup, adds a reference on a hit
 *   POST /cache-chunk            chunk status report
 *   GET  /cache-chunk            chunk states of a session (?sessionId=)
 *   POST /track-upload           start | progress | complete | fail
 *   POST /resume-upload          incomplete chunks and fresh edges
 *   POST /cancel-upload
 *   PUT  /chunks/:sessionId/:index   raw chunk bytes (direct path)
 *   GET  /dedup-savings
 *   POST /edge-metrics           sample from the metrics collector
 *   GET  /edges
 *   GET  /stats
 *
 * Every request needs `Authorization: Bearer <token>` and acts as the user
 * the token maps to; a userId in the body or query must match it. With no
 * tokens configured every request is rejected with 401.
 */
class UploadApi {
public:
    UploadApi(transfer::TransferOrchestrator& orchestrator,
              edge::EdgeRegistry& registry,
              const events::MetricsComponent& metrics,
              std::unordered_map<std::string, std::string> api_tokens,
              core::Clock clock = core::system_clock());

    void register_routes(network::HttpRouter& router);

private:
    using HttpContext = network::HttpContext;
    using HttpResponse = network::HttpResponse;

    bool authenticate(HttpContext& ctx, HttpResponse& response) const;
    Result<std::string> resolve_user(const HttpContext& ctx, const std::string& body_user) const;

    HttpResponse optimal_edges(const HttpContext& ctx);
    HttpResponse check_duplicate(const HttpContext& ctx);
    HttpResponse report_chunk(const HttpContext& ctx);
    HttpResponse list_chunks(const HttpContext& ctx);
    HttpResponse track_upload(const HttpContext& ctx);
    HttpResponse resume_upload(const HttpContext& ctx);
    HttpResponse cancel_upload(const HttpContext& ctx);
    HttpResponse put_chunk(const HttpContext& ctx);
    HttpResponse dedup_savings(const HttpContext& ctx);
    HttpResponse edge_metrics(const HttpContext& ctx);
    HttpResponse list_edges(const HttpContext& ctx);
    HttpResponse stats(const HttpContext& ctx);

    HttpResponse start_upload(const std::string& user_id, const StartUploadAction& action);

    transfer::TransferOrchestrator& orchestrator_;
    edge::EdgeRegistry& registry_;
    const events::MetricsComponent& metrics_;
    std::unordered_map<std::string, std::string> api_tokens_;
    core::Clock clock_;
};

} // namespace edgexfer::api
