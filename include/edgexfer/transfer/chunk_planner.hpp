#pragma once

#include "edgexfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace edgexfer::transfer {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
constexpr std::uint64_t kGiB = 1024ULL * kMiB;

/**
 * @brief Files strictly smaller than `below` use `chunk_size`
 */
struct ChunkBand {
    std::uint64_t below = 0;
    std::uint64_t chunk_size = 0;
};

struct PlannerOptions {
    std::vector<ChunkBand> bands{{100 * kMiB, 10 * kMiB}, {10 * kGiB, 50 * kMiB}};
    std::uint64_t largest_chunk_size = 100 * kMiB;
    std::uint32_t max_parallelism = 24;
    std::uint32_t per_edge_multiplier = 6;
};

/**
 * @brief How a file is cut and how many transfers run at once
 *
 * chunk_size * total_chunks >= file_size; only the last chunk may be short.
 */
struct ChunkPlan {
    std::uint64_t file_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t parallelism = 1;

    [[nodiscard]] std::uint64_t chunk_offset(std::uint32_t index) const noexcept {
        return static_cast<std::uint64_t>(index) * chunk_size;
    }

    [[nodiscard]] std::uint64_t chunk_length(std::uint32_t index) const noexcept;
};

struct TransferEstimate {
    std::uint64_t seconds = 0;
    double cost = 0.0;
};

class ChunkPlanner {
public:
    static constexpr double kDefaultBandwidthMbps = 500.0;
    static constexpr double kLinkEfficiency = 0.8;

    explicit ChunkPlanner(PlannerOptions options = {});

    Result<ChunkPlan> plan(std::uint64_t file_size, std::size_t edge_count) const;

    [[nodiscard]] std::uint64_t chunk_size_for(std::uint64_t file_size) const noexcept;
    [[nodiscard]] std::uint32_t parallelism_for(std::size_t edge_count) const noexcept;

    /// Rough wall time and egress cost. Bandwidths of the selected edges are
    /// averaged; an empty list assumes kDefaultBandwidthMbps.
    [[nodiscard]] TransferEstimate estimate(const ChunkPlan& plan,
                                            const std::vector<double>& edge_bandwidths_mbps,
                                            double cost_per_gb) const noexcept;

    [[nodiscard]] const PlannerOptions& options() const noexcept { return options_; }

private:
    PlannerOptions options_;
};

} // namespace edgexfer::transfer
