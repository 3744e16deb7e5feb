#pragma once

#include "edgexfer/core/result.hpp"
#include "edgexfer/edge/selector.hpp"
#include "edgexfer/edge/types.hpp"
#include "edgexfer/observability/logging.hpp"
#include "edgexfer/transfer/chunk_planner.hpp"
#include "edgexfer/transfer/orchestrator.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgexfer::config {

/// Edge registered at startup, optionally with a first metric sample.
struct SeedEdge {
    edge::EdgeLocation location;
    std::optional<edge::EdgeMetric> initial_metric;
};

struct ServiceConfig {
    std::uint16_t port = 8080;
    std::size_t io_threads = 4;
    std::filesystem::path data_dir = "edgexfer_data";
    std::optional<std::filesystem::path> state_dir;  ///< Defaults to <data_dir>/sessions
    observability::LoggingConfig logging;
    std::unordered_map<std::string, std::string> api_tokens;  ///< bearer token -> user id
    std::chrono::seconds session_ttl{std::chrono::hours(24 * 7)};
    std::chrono::seconds sweep_interval{std::chrono::seconds(60)};
    edge::SelectorOptions selector;
    transfer::PlannerOptions planner;
    transfer::OrchestratorOptions orchestrator;
    std::vector<SeedEdge> edges;

    [[nodiscard]] std::filesystem::path sessions_dir() const {
        return state_dir ? *state_dir : data_dir / "sessions";
    }
    [[nodiscard]] std::filesystem::path dedup_dir() const { return data_dir / "dedup"; }
    [[nodiscard]] std::filesystem::path objects_dir() const { return data_dir / "objects"; }
};

Result<ServiceConfig> parse_config(const std::string& text);
Result<ServiceConfig> load_config(const std::filesystem::path& path);

/// Applies -p/--port, -d/--data, -t/--threads and -v/--verbose on top of
/// `config`. -c/--config is consumed by the caller before loading.
Result<void> apply_cli_overrides(ServiceConfig& config, int argc, char* argv[]);

/// Value following -c/--config, if present.
std::optional<std::filesystem::path> config_path_from_args(int argc, char* argv[]);

} // namespace edgexfer::config
