#include "edgexfer/config/config.hpp"

#include "edgexfer/core/files.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <string>

namespace edgexfer::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<edge::EdgeLocation> location_from_json(const json& j, const std::string& context) {
    if (!j.is_object()) {
        return Err<edge::EdgeLocation>(ErrorKind::InvalidArgument, context + " must be an object");
    }

    edge::EdgeLocation location;
    location.id = j.value("id", std::string{});
    location.url = j.value("url", std::string{});
    location.city = j.value("city", std::string{});
    location.country = j.value("country", std::string{});
    location.provider = j.value("provider", std::string{});
    location.location.lat = j.value("lat", 0.0);
    location.location.lng = j.value("lng", 0.0);
    location.active = j.value("active", true);

    if (location.id.empty() || location.url.empty()) {
        return Err<edge::EdgeLocation>(ErrorKind::InvalidArgument, context + " requires id and url");
    }
    if (std::fabs(location.location.lat) > 90.0 || std::fabs(location.location.lng) > 180.0) {
        return Err<edge::EdgeLocation>(ErrorKind::InvalidArgument, context + " has invalid coordinates");
    }
    return Ok(std::move(location));
}

Result<void> read_edges(const json& root, ServiceConfig& config) {
    auto it = root.find("edges");
    if (it == root.end()) {
        return Ok();
    }
    if (!it->is_array()) {
        return Err<void>(ErrorKind::InvalidArgument, "edges must be an array");
    }

    for (const auto& item : *it) {
        auto location = location_from_json(item, "edge entry");
        if (location.is_error()) {
            return Err<void>(location.error());
        }

        SeedEdge seed;
        seed.location = std::move(location.value());
        if (auto metrics = item.find("metrics"); metrics != item.end() && metrics->is_object()) {
            edge::EdgeMetric metric;
            metric.edge_id = seed.location.id;
            metric.latency_ms = metrics->value("latency_ms", 0.0);
            metric.load_percent = metrics->value("load_percent", 0.0);
            metric.bandwidth_mbps = metrics->value("bandwidth_mbps", 0.0);
            metric.active_uploads = metrics->value("active_uploads", std::uint32_t{0});
            metric.error_rate = metrics->value("error_rate", 0.0);
            seed.initial_metric = metric;
        }
        config.edges.push_back(std::move(seed));
    }
    return Ok();
}

Result<void> read_sections(const json& root, ServiceConfig& config) {
    if (auto server = root.find("server"); server != root.end()) {
        const auto port = server->value("port", static_cast<int>(config.port));
        if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
            return Err<void>(ErrorKind::InvalidArgument, "server.port out of range");
        }
        config.port = static_cast<std::uint16_t>(port);
        config.io_threads = server->value("threads", config.io_threads);
    }

    if (auto storage = root.find("storage"); storage != root.end()) {
        config.data_dir = storage->value("data_dir", config.data_dir.string());
        if (auto state = storage->find("state_dir"); state != storage->end() && state->is_string()) {
            config.state_dir = fs::path(state->get<std::string>());
        }
    }

    if (auto logging = root.find("logging"); logging != root.end()) {
        config.logging.level = logging->value("level", config.logging.level);
        config.logging.pattern = logging->value("pattern", config.logging.pattern);
    }

    if (auto auth = root.find("auth"); auth != root.end()) {
        if (auto tokens = auth->find("tokens"); tokens != auth->end()) {
            if (!tokens->is_object()) {
                return Err<void>(ErrorKind::InvalidArgument, "auth.tokens must map token to user id");
            }
            for (const auto& [token, user] : tokens->items()) {
                if (token.empty() || !user.is_string() || user.get<std::string>().empty()) {
                    return Err<void>(ErrorKind::InvalidArgument, "auth.tokens entries must be non-empty strings");
                }
                config.api_tokens[token] = user.get<std::string>();
            }
        }
    }

    if (auto sessions = root.find("sessions"); sessions != root.end()) {
        config.session_ttl = std::chrono::seconds(sessions->value("ttl_seconds", config.session_ttl.count()));
        config.sweep_interval =
            std::chrono::seconds(sessions->value("sweep_interval_seconds", config.sweep_interval.count()));
        if (config.session_ttl.count() <= 0 || config.sweep_interval.count() <= 0) {
            return Err<void>(ErrorKind::InvalidArgument, "sessions durations must be positive");
        }
    }

    if (auto selection = root.find("selection"); selection != root.end()) {
        config.selector.max_edges = selection->value("max_edges", config.selector.max_edges);
        config.selector.metric_staleness = std::chrono::seconds(
            selection->value("metric_staleness_seconds", config.selector.metric_staleness.count()));
        if (config.selector.max_edges == 0) {
            return Err<void>(ErrorKind::InvalidArgument, "selection.max_edges must be positive");
        }
    }

    if (auto planning = root.find("planning"); planning != root.end()) {
        config.planner.max_parallelism = planning->value("max_parallelism", config.planner.max_parallelism);
        config.planner.per_edge_multiplier =
            planning->value("per_edge_multiplier", config.planner.per_edge_multiplier);
    }

    auto& orchestrator = config.orchestrator;
    if (auto transfer = root.find("transfer"); transfer != root.end()) {
        orchestrator.chunk_timeout = std::chrono::milliseconds(
            transfer->value("chunk_timeout_ms", orchestrator.chunk_timeout.count()));
        orchestrator.max_chunk_attempts = transfer->value("max_chunk_attempts", orchestrator.max_chunk_attempts);
        orchestrator.max_file_size = transfer->value("max_file_size", orchestrator.max_file_size);
        orchestrator.user_quota_bytes = transfer->value("user_quota_bytes", orchestrator.user_quota_bytes);
        orchestrator.cost_per_gb = transfer->value("cost_per_gb", orchestrator.cost_per_gb);
        if (orchestrator.chunk_timeout.count() <= 0 || orchestrator.max_chunk_attempts == 0 ||
            orchestrator.cost_per_gb < 0.0) {
            return Err<void>(ErrorKind::InvalidArgument, "transfer settings out of range");
        }
    }

    if (auto origin = root.find("default_origin"); origin != root.end()) {
        orchestrator.default_origin.lat = origin->value("lat", orchestrator.default_origin.lat);
        orchestrator.default_origin.lng = origin->value("lng", orchestrator.default_origin.lng);
    }

    if (auto direct = root.find("direct_edge"); direct != root.end()) {
        auto location = location_from_json(*direct, "direct_edge");
        if (location.is_error()) {
            return Err<void>(location.error());
        }
        orchestrator.direct_edge = std::move(location.value());
    }

    return read_edges(root, config);
}

std::optional<std::string> flag_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        return std::nullopt;
    }
    return std::string(argv[++i]);
}

} // namespace

Result<ServiceConfig> parse_config(const std::string& text) {
    auto root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return Err<ServiceConfig>(ErrorKind::InvalidArgument, "Config is not a JSON object");
    }

    ServiceConfig config;
    try {
        if (auto read = read_sections(root, config); read.is_error()) {
            return Err<ServiceConfig>(read.error());
        }
    } catch (const json::exception& e) {
        return Err<ServiceConfig>(ErrorKind::InvalidArgument, std::string("Config has a wrong type: ") + e.what());
    }
    return Ok(std::move(config));
}

Result<ServiceConfig> load_config(const fs::path& path) {
    auto text = core::read_file(path);
    if (text.is_error()) {
        return Err<ServiceConfig>(text.error());
    }
    auto parsed = parse_config(text.value());
    if (parsed.is_error()) {
        return Err<ServiceConfig>(parsed.error().kind, path.string() + ": " + parsed.error().message);
    }
    spdlog::debug("Loaded config from {} ({} edge(s), {} token(s))",
                  path.string(), parsed.value().edges.size(), parsed.value().api_tokens.size());
    return parsed;
}

std::optional<fs::path> config_path_from_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return fs::path(argv[i + 1]);
        }
    }
    return std::nullopt;
}

Result<void> apply_cli_overrides(ServiceConfig& config, int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-p" || arg == "--port") {
            auto value = flag_value(argc, argv, i);
            if (!value) {
                return Err<void>(ErrorKind::InvalidArgument, arg + " requires a value");
            }
            try {
                const auto port = std::stoi(*value);
                if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
                    return Err<void>(ErrorKind::InvalidArgument, "Port out of range: " + *value);
                }
                config.port = static_cast<std::uint16_t>(port);
            } catch (const std::logic_error&) {
                return Err<void>(ErrorKind::InvalidArgument, "Invalid port: " + *value);
            }
        } else if (arg == "-t" || arg == "--threads") {
            auto value = flag_value(argc, argv, i);
            if (!value) {
                return Err<void>(ErrorKind::InvalidArgument, arg + " requires a value");
            }
            try {
                const auto threads = std::stoul(*value);
                if (threads == 0) {
                    return Err<void>(ErrorKind::InvalidArgument, "Thread count must be positive");
                }
                config.io_threads = threads;
            } catch (const std::logic_error&) {
                return Err<void>(ErrorKind::InvalidArgument, "Invalid thread count: " + *value);
            }
        } else if (arg == "-d" || arg == "--data") {
            auto value = flag_value(argc, argv, i);
            if (!value) {
                return Err<void>(ErrorKind::InvalidArgument, arg + " requires a value");
            }
            config.data_dir = fs::path(*value);
        } else if (arg == "-c" || arg == "--config") {
            ++i;
        } else if (arg == "-v" || arg == "--verbose") {
            config.logging.level = "debug";
        } else {
            return Err<void>(ErrorKind::InvalidArgument, "Unknown option: " + arg);
        }
    }
    return Ok();
}

} // namespace edgexfer::config
