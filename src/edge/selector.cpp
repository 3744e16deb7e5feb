#include "edgexfer/edge/selector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace edgexfer::edge {
namespace {

double clamp01(double value) noexcept {
    return std::min(1.0, std::max(0.0, value));
}

} // namespace

ScoringWeights ScoringWeights::for_priority(Priority priority) noexcept {
    switch (priority) {
        case Priority::Speed:
            return ScoringWeights{0.40, 0.30, 0.15, 0.10, 0.05};
        case Priority::Cost:
            return ScoringWeights{0.15, 0.10, 0.40, 0.30, 0.05};
        case Priority::Balanced:
            break;
    }
    return ScoringWeights{0.2, 0.2, 0.2, 0.2, 0.2};
}

EdgeSelector::EdgeSelector(const EdgeRegistry& registry, SelectorOptions options, core::Clock clock)
    : registry_(registry),
      options_(std::move(options)),
      clock_(std::move(clock)) {}

double EdgeSelector::score(const EdgeMetric& metric, double distance_km, const ScoringWeights& weights) const noexcept {
    const double distance_score = clamp01(1.0 - distance_km / options_.distance_range_km);
    const double latency_score = clamp01(1.0 - metric.latency_ms / options_.latency_range_ms);
    const double load_score = clamp01(1.0 - metric.load_percent / options_.load_range_percent);
    const double bandwidth_score = clamp01(metric.bandwidth_mbps / options_.bandwidth_range_mbps);
    const double error_score = clamp01(1.0 - metric.error_rate / options_.error_range_percent);

    return distance_score * weights.distance +
           latency_score * weights.latency +
           load_score * weights.load +
           bandwidth_score * weights.bandwidth +
           error_score * weights.error;
}

Result<std::vector<EdgeScore>> EdgeSelector::select_edges(std::uint64_t file_size,
                                                          const GeoPoint& origin,
                                                          Priority priority,
                                                          const std::unordered_set<std::string>& excluded) const {
    const auto now = clock_();
    const auto cutoff = now - options_.metric_staleness;
    const auto weights = ScoringWeights::for_priority(priority);

    std::vector<EdgeScore> candidates;
    for (auto& item : registry_.snapshot()) {
        if (!item.edge.active || !item.latest || excluded.count(item.edge.id) > 0) {
            continue;
        }
        if (item.latest->timestamp < cutoff) {
            continue;
        }
        EdgeScore candidate;
        candidate.distance_km = haversine_km(origin, item.edge.location);
        candidate.score = score(*item.latest, candidate.distance_km, weights);
        candidate.metric = std::move(*item.latest);
        candidate.edge = std::move(item.edge);
        candidates.push_back(std::move(candidate));
    }

    if (candidates.empty()) {
        return Err<std::vector<EdgeScore>>(ErrorKind::NoEdgesAvailable,
                                           "No active edge with a fresh metric sample");
    }

    std::sort(candidates.begin(), candidates.end(), [](const EdgeScore& a, const EdgeScore& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.metric.latency_ms != b.metric.latency_ms) {
            return a.metric.latency_ms < b.metric.latency_ms;
        }
        return a.edge.id < b.edge.id;
    });

    if (candidates.size() > options_.max_edges && options_.max_edges > 0) {
        candidates.resize(options_.max_edges);
    }

    double total = 0.0;
    for (const auto& candidate : candidates) {
        total += candidate.score;
    }
    for (auto& candidate : candidates) {
        candidate.weight = total > 0.0 ? candidate.score / total
                                       : 1.0 / static_cast<double>(candidates.size());
    }

    spdlog::debug("Selected {} edge(s) for {} bytes (priority={}), top={} score={:.4f}",
                  candidates.size(), file_size, to_string(priority),
                  candidates.front().edge.id, candidates.front().score);
    return Ok(std::move(candidates));
}

} // namespace edgexfer::edge
