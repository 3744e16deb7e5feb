#include "edgexfer/api/upload_api.hpp"
#include "edgexfer/config/config.hpp"
#include "edgexfer/dedup/index.hpp"
#include "edgexfer/edge/registry.hpp"
#include "edgexfer/edge/selector.hpp"
#include "edgexfer/events/components.hpp"
#include "edgexfer/events/event_bus.hpp"
#include "edgexfer/events/events.hpp"
#include "edgexfer/network/http_router.hpp"
#include "edgexfer/network/http_server_asio.hpp"
#include "edgexfer/observability/logging.hpp"
#include "edgexfer/session/store.hpp"
#include "edgexfer/transfer/chunk_planner.hpp"
#include "edgexfer/transfer/edge_transport.hpp"
#include "edgexfer/transfer/object_store.hpp"
#include "edgexfer/transfer/orchestrator.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

using edgexfer::network::HttpContext;
using edgexfer::network::HttpMethodUtils;
using edgexfer::network::HttpRequest;
using edgexfer::network::HttpResponse;
using edgexfer::network::HttpRouter;
using edgexfer::network::HttpServerAsio;

namespace asio = boost::asio;

namespace {

edgexfer::Result<edgexfer::config::ServiceConfig> resolve_config(int argc, char* argv[]) {
    edgexfer::config::ServiceConfig config;
    if (auto path = edgexfer::config::config_path_from_args(argc, argv)) {
        auto loaded = edgexfer::config::load_config(*path);
        if (loaded.is_error()) {
            return loaded;
        }
        config = std::move(loaded.value());
    }
    if (auto applied = edgexfer::config::apply_cli_overrides(config, argc, argv); applied.is_error()) {
        return edgexfer::Err<edgexfer::config::ServiceConfig>(applied.error());
    }
    return edgexfer::Ok(std::move(config));
}

std::size_t seed_registry(edgexfer::edge::EdgeRegistry& registry, const edgexfer::config::ServiceConfig& config) {
    std::size_t registered = 0;
    for (const auto& seed : config.edges) {
        if (auto added = registry.register_edge(seed.location); added.is_error()) {
            spdlog::warn("Skipping edge {}: {}", seed.location.id, added.error().message);
            continue;
        }
        ++registered;
        if (seed.initial_metric) {
            auto metric = *seed.initial_metric;
            metric.edge_id = seed.location.id;
            metric.timestamp = std::chrono::system_clock::now();
            if (auto recorded = registry.record_metric(metric); recorded.is_error()) {
                spdlog::warn("Initial metric for {} rejected: {}", seed.location.id, recorded.error().message);
            }
        }
    }
    return registered;
}

// Periodically expires sessions and trims metric history.
void schedule_sweep(asio::steady_timer& timer,
                    std::chrono::seconds interval,
                    edgexfer::transfer::TransferOrchestrator& orchestrator,
                    edgexfer::edge::EdgeRegistry& registry,
                    std::chrono::seconds staleness) {
    timer.expires_after(interval);
    timer.async_wait([&timer, interval, &orchestrator, &registry, staleness](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        const auto expired = orchestrator.expire_sessions();
        const auto pruned = registry.prune_metrics(std::chrono::system_clock::now() - staleness);
        if (expired > 0 || pruned > 0) {
            spdlog::info("Sweep: expired {} session(s), pruned {} metric sample(s)", expired, pruned);
        }
        schedule_sweep(timer, interval, orchestrator, registry, staleness);
    });
}

} // namespace

int main(int argc, char* argv[]) {
    auto resolved = resolve_config(argc, argv);
    if (resolved.is_error()) {
        edgexfer::observability::init_logging({});
        spdlog::error("Configuration error: {}", edgexfer::describe(resolved.error()));
        return 1;
    }
    const auto config = std::move(resolved.value());
    edgexfer::observability::init_logging(config.logging);

    if (config.api_tokens.empty()) {
        spdlog::error("No API tokens configured; refusing to serve unauthenticated requests");
        return 1;
    }

    spdlog::info("=== edgexfer upload server ===");
    spdlog::info("Data directory: {}", config.data_dir.string());

    edgexfer::events::EventBus event_bus;
    edgexfer::events::LoggerComponent logger(event_bus);
    edgexfer::events::MetricsComponent metrics(event_bus);

    edgexfer::edge::InMemoryEdgeRegistry registry;
    const auto edge_count = seed_registry(registry, config);
    if (edge_count == 0) {
        spdlog::warn("No edges configured; every upload will use {}", config.orchestrator.direct_edge.id);
    }

    auto dedup = edgexfer::dedup::DeduplicationIndex::open(config.dedup_dir());
    if (dedup.is_error()) {
        spdlog::error("Cannot open dedup index: {}", edgexfer::describe(dedup.error()));
        return 1;
    }

    edgexfer::session::SessionStoreOptions store_options;
    store_options.state_dir = config.sessions_dir();
    store_options.ttl = config.session_ttl;
    edgexfer::session::UploadSessionStore sessions(store_options);
    auto restored = sessions.load();
    if (restored.is_error()) {
        spdlog::error("Cannot load sessions: {}", edgexfer::describe(restored.error()));
        return 1;
    }
    spdlog::info("Restored {} session(s) from {}", restored.value(), config.sessions_dir().string());

    edgexfer::transfer::FilesystemObjectStore objects(config.objects_dir());
    edgexfer::transfer::RelayEdgeTransport transport(objects);
    edgexfer::edge::EdgeSelector selector(registry, config.selector);
    edgexfer::transfer::TransferOrchestrator orchestrator(registry,
                                                          selector,
                                                          edgexfer::transfer::ChunkPlanner(config.planner),
                                                          *dedup.value(),
                                                          sessions,
                                                          objects,
                                                          transport,
                                                          event_bus,
                                                          config.orchestrator);

    HttpRouter router;
    router.use([](HttpContext& ctx, HttpResponse&) {
        spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });

    edgexfer::api::UploadApi api(orchestrator, registry, metrics, config.api_tokens);
    api.register_routes(router);
    for (const auto& route : router.list_routes()) {
        spdlog::debug("Route: {}", route);
    }
    try {
        asio::io_context io_context;
        HttpServerAsio server(io_context, config.port);
        server.set_handler([&router](const HttpRequest& request) {
            return router.handle_request(request);
        });

        asio::steady_timer sweep_timer(io_context);
        schedule_sweep(sweep_timer, config.sweep_interval, orchestrator, registry,
                       config.selector.metric_staleness);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            event_bus.emit(edgexfer::events::ServerShuttingDownEvent{signal == SIGINT ? "interrupt" : "terminate"});
            server.stop();
            sweep_timer.cancel();
            io_context.stop();
        });

        event_bus.emit(edgexfer::events::ServerStartedEvent{server.get_port(), edge_count});

        const auto thread_count = std::max<std::size_t>(1, config.io_threads);
        std::vector<std::thread> io_threads;
        io_threads.reserve(thread_count - 1);
        for (std::size_t i = 1; i < thread_count; ++i) {
            io_threads.emplace_back([&io_context] { io_context.run(); });
        }
        io_context.run();
        for (auto& t : io_threads) {
            t.join();
        }
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }

    metrics.print_stats();
    spdlog::info("Server shut down cleanly");
    edgexfer::observability::shutdown_logging();
    return 0;
}
