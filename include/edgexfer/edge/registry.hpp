#pragma once

#include "edgexfer/core/result.hpp"
#include "edgexfer/edge/types.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace edgexfer::edge {

/**
 * @brief Edge plus its most recent metric sample, if any
 */
struct EdgeSnapshot {
    EdgeLocation edge;
    std::optional<EdgeMetric> latest;
};

/**
 * @brief Repository of known edges and their live metrics
 *
 * Injected into the selector and orchestrator; there is no process-wide
 * registry. Edges are never removed, only deactivated. Metric history is
 * append-only per edge and trimmed by age.
 */
class EdgeRegistry {
public:
    virtual ~EdgeRegistry() = default;

    virtual Result<void> register_edge(EdgeLocation edge) = 0;
    virtual Result<void> set_active(const std::string& edge_id, bool active) = 0;
    virtual Result<void> record_metric(EdgeMetric metric) = 0;

    [[nodiscard]] virtual std::optional<EdgeLocation> find_edge(const std::string& edge_id) const = 0;
    [[nodiscard]] virtual std::optional<EdgeMetric> latest_metric(const std::string& edge_id) const = 0;

    /// All edges ordered by id, each with its latest sample.
    [[nodiscard]] virtual std::vector<EdgeSnapshot> snapshot() const = 0;

    /// Drops superseded samples older than the cutoff. The newest sample of
    /// each edge is always kept. Returns the number of samples removed.
    virtual std::size_t prune_metrics(core::TimePoint older_than) = 0;
};

class InMemoryEdgeRegistry final : public EdgeRegistry {
public:
    static constexpr std::size_t kDefaultHistoryLimit = 256;

    explicit InMemoryEdgeRegistry(std::size_t history_limit = kDefaultHistoryLimit);

    Result<void> register_edge(EdgeLocation edge) override;
    Result<void> set_active(const std::string& edge_id, bool active) override;
    Result<void> record_metric(EdgeMetric metric) override;

    [[nodiscard]] std::optional<EdgeLocation> find_edge(const std::string& edge_id) const override;
    [[nodiscard]] std::optional<EdgeMetric> latest_metric(const std::string& edge_id) const override;
    [[nodiscard]] std::vector<EdgeSnapshot> snapshot() const override;

    std::size_t prune_metrics(core::TimePoint older_than) override;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t sample_count(const std::string& edge_id) const;

private:
    struct Entry {
        EdgeLocation edge;
        std::deque<EdgeMetric> samples;  ///< Ascending by timestamp
    };

    std::size_t history_limit_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> edges_;
};

} // namespace edgexfer::edge
