#include "edgexfer/config/config.hpp"
#include "edgexfer/core/hash.hpp"
#include "edgexfer/dedup/index.hpp"
#include "edgexfer/edge/registry.hpp"
#include "edgexfer/edge/selector.hpp"
#include "edgexfer/events/components.hpp"
#include "edgexfer/events/event_bus.hpp"
#include "edgexfer/observability/logging.hpp"
#include "edgexfer/session/store.hpp"
#include "edgexfer/transfer/chunk_planner.hpp"
#include "edgexfer/transfer/chunk_source.hpp"
#include "edgexfer/transfer/edge_transport.hpp"
#include "edgexfer/transfer/object_store.hpp"
#include "edgexfer/transfer/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <variant>

namespace fs = std::filesystem;

namespace {

void usage(const char* program) {
    spdlog::info("Usage: {} <file> [-c config.json] [-d data_dir] [-u user]", program);
}

} // namespace

// Uploads one local file through the configured edges, relaying chunks into
// the local object store, and prints the resulting object key.
int main(int argc, char* argv[]) {
    edgexfer::observability::init_logging({});

    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }
    const fs::path file = argv[1];
    std::string user = "local-user";

    edgexfer::config::ServiceConfig config;
    if (auto path = edgexfer::config::config_path_from_args(argc, argv)) {
        auto loaded = edgexfer::config::load_config(*path);
        if (loaded.is_error()) {
            spdlog::error("Configuration error: {}", edgexfer::describe(loaded.error()));
            return 1;
        }
        config = std::move(loaded.value());
    }
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            config.data_dir = fs::path(argv[++i]);
        } else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
            user = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    auto hash = edgexfer::core::sha256_file(file);
    if (hash.is_error()) {
        spdlog::error("Cannot hash {}: {}", file.string(), hash.error().message);
        return 1;
    }
    edgexfer::transfer::FileChunkSource source(file);
    spdlog::info("{}: {} bytes, sha256 {}", file.string(), source.size(), hash.value());

    edgexfer::events::EventBus event_bus;
    edgexfer::events::LoggerComponent logger(event_bus);
    edgexfer::events::MetricsComponent metrics(event_bus);

    edgexfer::edge::InMemoryEdgeRegistry registry;
    for (const auto& seed : config.edges) {
        if (auto added = registry.register_edge(seed.location); added.is_error()) {
            spdlog::warn("Skipping edge {}: {}", seed.location.id, added.error().message);
            continue;
        }
        if (seed.initial_metric) {
            auto metric = *seed.initial_metric;
            metric.edge_id = seed.location.id;
            metric.timestamp = std::chrono::system_clock::now();
            if (auto recorded = registry.record_metric(metric); recorded.is_error()) {
                spdlog::warn("Initial metric for {} rejected: {}", seed.location.id, recorded.error().message);
            }
        }
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
    if (auto restored = sessions.load(); restored.is_error()) {
        spdlog::error("Cannot load sessions: {}", edgexfer::describe(restored.error()));
        return 1;
    }

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

    edgexfer::transfer::FileMeta meta;
    meta.owner_id = user;
    meta.file_name = file.filename().string();
    meta.content_hash = hash.value();
    meta.file_size = source.size();
    meta.priority = edgexfer::edge::Priority::Speed;

    auto started = orchestrator.start_upload(meta);
    if (started.is_error()) {
        spdlog::error("Upload rejected: {}", edgexfer::describe(started.error()));
        return 1;
    }

    if (const auto* duplicate = std::get_if<edgexfer::transfer::DuplicateResult>(&started.value())) {
        spdlog::info("Already stored as {} ({} bytes saved)", duplicate->object_key, duplicate->bytes_saved);
        return 0;
    }

    const auto& plan = std::get<edgexfer::transfer::UploadPlan>(started.value());
    spdlog::info("Session {}: {} chunk(s) of {} bytes, {} thread(s), ~{} s",
                 plan.session.session_id, plan.session.total_chunks, plan.session.chunk_size,
                 plan.session.parallelism, plan.strategy.estimate.seconds);

    auto finished = orchestrator.run_transfer(plan.session.session_id, source);
    if (finished.is_error()) {
        spdlog::error("Upload failed: {}", edgexfer::describe(finished.error()));
        return 1;
    }

    if (auto content = orchestrator.find_content(hash.value())) {
        spdlog::info("Stored as {}", content->object_key);
    }
    metrics.print_stats();
    return 0;
}
