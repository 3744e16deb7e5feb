#pragma once

#include "edgexfer/core/clock.hpp"
#include "edgexfer/core/result.hpp"
#include "edgexfer/edge/registry.hpp"
#include "edgexfer/edge/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace edgexfer::edge {

/**
 * @brief Relative importance of the five scoring factors
 */
struct ScoringWeights {
    double latency = 0.2;
    double bandwidth = 0.2;
    double load = 0.2;
    double distance = 0.2;
    double error = 0.2;

    static ScoringWeights for_priority(Priority priority) noexcept;
};

/**
 * @brief Selection tuning; the ranges map raw metrics onto [0, 1]
 */
struct SelectorOptions {
    std::size_t max_edges = 5;
    std::chrono::seconds metric_staleness{std::chrono::minutes(5)};
    double distance_range_km = 10000.0;
    double latency_range_ms = 200.0;
    double load_range_percent = 100.0;
    double bandwidth_range_mbps = 1000.0;
    double error_range_percent = 10.0;
};

struct EdgeScore {
    EdgeLocation edge;
    EdgeMetric metric;
    double distance_km = 0.0;
    double score = 0.0;
    double weight = 0.0;  ///< Fraction of chunks this edge receives
};

/**
 * @brief Ranks edges for an upload from geography and live metrics
 *
 * Only active edges whose latest sample falls inside the staleness window
 * are eligible. The result is ordered by score (ties: lower latency, then
 * edge id) and its weights sum to 1.0. Identical inputs always produce an
 * identical result.
 */
class EdgeSelector {
public:
    explicit EdgeSelector(const EdgeRegistry& registry,
                          SelectorOptions options = {},
                          core::Clock clock = core::system_clock());

    Result<std::vector<EdgeScore>> select_edges(std::uint64_t file_size,
                                                const GeoPoint& origin,
                                                Priority priority,
                                                const std::unordered_set<std::string>& excluded = {}) const;

    [[nodiscard]] double score(const EdgeMetric& metric, double distance_km, const ScoringWeights& weights) const noexcept;

    [[nodiscard]] const SelectorOptions& options() const noexcept { return options_; }

private:
    const EdgeRegistry& registry_;
    SelectorOptions options_;
    core::Clock clock_;
};

} // namespace edgexfer::edge
