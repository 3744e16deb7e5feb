#include "edgexfer/edge/registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace edgexfer::edge {
namespace {

Result<void> validate_metric(const EdgeMetric& metric) {
    const double values[] = {metric.latency_ms, metric.load_percent, metric.bandwidth_mbps, metric.error_rate};
    for (double value : values) {
        if (!std::isfinite(value) || value < 0.0) {
            return Err<void>(ErrorKind::InvalidArgument,
                             "Metric values must be finite and non-negative for edge " + metric.edge_id);
        }
    }
    return Ok();
}

} // namespace

InMemoryEdgeRegistry::InMemoryEdgeRegistry(std::size_t history_limit)
    : history_limit_(std::max<std::size_t>(1, history_limit)) {}

Result<void> InMemoryEdgeRegistry::register_edge(EdgeLocation edge) {
    if (edge.id.empty() || edge.url.empty()) {
        return Err<void>(ErrorKind::InvalidArgument, "Edge id and url are required");
    }

    std::unique_lock lock(mutex_);
    if (edges_.count(edge.id) > 0) {
        return Err<void>(ErrorKind::AlreadyExists, "Edge already registered: " + edge.id);
    }
    spdlog::debug("Registered edge {} ({}, {}) at {}", edge.id, edge.city, edge.country, edge.url);
    const auto id = edge.id;
    edges_.emplace(id, Entry{std::move(edge), {}});
    return Ok();
}

Result<void> InMemoryEdgeRegistry::set_active(const std::string& edge_id, bool active) {
    std::unique_lock lock(mutex_);
    auto it = edges_.find(edge_id);
    if (it == edges_.end()) {
        return Err<void>(ErrorKind::NotFound, "Unknown edge: " + edge_id);
    }
    if (it->second.edge.active != active) {
        spdlog::info("Edge {} {}", edge_id, active ? "activated" : "deactivated");
    }
    it->second.edge.active = active;
    return Ok();
}

Result<void> InMemoryEdgeRegistry::record_metric(EdgeMetric metric) {
    if (auto valid = validate_metric(metric); valid.is_error()) {
        return valid;
    }

    std::unique_lock lock(mutex_);
    auto it = edges_.find(metric.edge_id);
    if (it == edges_.end()) {
        return Err<void>(ErrorKind::NotFound, "Unknown edge: " + metric.edge_id);
    }

    auto& samples = it->second.samples;
    // Samples may arrive out of order from the collector.
    auto pos = std::upper_bound(samples.begin(), samples.end(), metric.timestamp,
                                [](const core::TimePoint& ts, const EdgeMetric& m) {
                                    return ts < m.timestamp;
                                });
    samples.insert(pos, std::move(metric));

    while (samples.size() > history_limit_) {
        samples.pop_front();
    }
    return Ok();
}

std::optional<EdgeLocation> InMemoryEdgeRegistry::find_edge(const std::string& edge_id) const {
    std::shared_lock lock(mutex_);
    auto it = edges_.find(edge_id);
    if (it == edges_.end()) {
        return std::nullopt;
    }
    return it->second.edge;
}

std::optional<EdgeMetric> InMemoryEdgeRegistry::latest_metric(const std::string& edge_id) const {
    std::shared_lock lock(mutex_);
    auto it = edges_.find(edge_id);
    if (it == edges_.end() || it->second.samples.empty()) {
        return std::nullopt;
    }
    return it->second.samples.back();
}

std::vector<EdgeSnapshot> InMemoryEdgeRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<EdgeSnapshot> result;
    result.reserve(edges_.size());
    for (const auto& [id, entry] : edges_) {
        EdgeSnapshot item{entry.edge, std::nullopt};
        if (!entry.samples.empty()) {
            item.latest = entry.samples.back();
        }
        result.push_back(std::move(item));
    }
    return result;
}

std::size_t InMemoryEdgeRegistry::prune_metrics(core::TimePoint older_than) {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto& [id, entry] : edges_) {
        auto& samples = entry.samples;
        while (samples.size() > 1 && samples.front().timestamp < older_than) {
            samples.pop_front();
            ++removed;
        }
    }
    if (removed > 0) {
        spdlog::debug("Pruned {} stale edge metric samples", removed);
    }
    return removed;
}

std::size_t InMemoryEdgeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return edges_.size();
}

std::size_t InMemoryEdgeRegistry::sample_count(const std::string& edge_id) const {
    std::shared_lock lock(mutex_);
    auto it = edges_.find(edge_id);
    return it == edges_.end() ? 0 : it->second.samples.size();
}

} // namespace edgexfer::edge
