#include "edgexfer/transfer/chunk_planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace edgexfer::transfer {

std::uint64_t ChunkPlan::chunk_length(std::uint32_t index) const noexcept {
    if (index >= total_chunks) {
        return 0;
    }
    const auto offset = chunk_offset(index);
    return std::min(chunk_size, file_size - offset);
}

ChunkPlanner::ChunkPlanner(PlannerOptions options) : options_(std::move(options)) {
    std::sort(options_.bands.begin(), options_.bands.end(),
              [](const ChunkBand& a, const ChunkBand& b) { return a.below < b.below; });
    options_.max_parallelism = std::max<std::uint32_t>(1, options_.max_parallelism);
    options_.per_edge_multiplier = std::max<std::uint32_t>(1, options_.per_edge_multiplier);
}

std::uint64_t ChunkPlanner::chunk_size_for(std::uint64_t file_size) const noexcept {
    for (const auto& band : options_.bands) {
        if (file_size < band.below) {
            return band.chunk_size;
        }
    }
    return options_.largest_chunk_size;
}

std::uint32_t ChunkPlanner::parallelism_for(std::size_t edge_count) const noexcept {
    const std::uint64_t edges = std::max<std::size_t>(1, edge_count);
    const std::uint64_t wanted = edges * options_.per_edge_multiplier;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(options_.max_parallelism, wanted));
}

Result<ChunkPlan> ChunkPlanner::plan(std::uint64_t file_size, std::size_t edge_count) const {
    if (file_size == 0) {
        return Err<ChunkPlan>(ErrorKind::InvalidArgument, "File size must be greater than zero");
    }

    const auto chunk_size = chunk_size_for(file_size);
    if (chunk_size == 0) {
        return Err<ChunkPlan>(ErrorKind::InvalidArgument, "Chunk band configured with zero chunk size");
    }

    const std::uint64_t chunks = (file_size + chunk_size - 1) / chunk_size;
    if (chunks > std::numeric_limits<std::uint32_t>::max()) {
        return Err<ChunkPlan>(ErrorKind::InvalidArgument, "File requires too many chunks");
    }

    ChunkPlan plan;
    plan.file_size = file_size;
    plan.chunk_size = chunk_size;
    plan.total_chunks = static_cast<std::uint32_t>(chunks);
    plan.parallelism = parallelism_for(edge_count);
    return Ok(plan);
}

TransferEstimate ChunkPlanner::estimate(const ChunkPlan& plan,
                                        const std::vector<double>& edge_bandwidths_mbps,
                                        double cost_per_gb) const noexcept {
    double average = kDefaultBandwidthMbps;
    if (!edge_bandwidths_mbps.empty()) {
        double sum = 0.0;
        for (double bw : edge_bandwidths_mbps) {
            sum += bw > 0.0 ? bw : kDefaultBandwidthMbps;
        }
        average = sum / static_cast<double>(edge_bandwidths_mbps.size());
    }

    const double effective = average * std::max<std::uint32_t>(1, plan.parallelism) * kLinkEfficiency;
    const double size_mib = static_cast<double>(plan.file_size) / static_cast<double>(kMiB);
    const double size_gib = static_cast<double>(plan.file_size) / static_cast<double>(kGiB);

    TransferEstimate estimate;
    estimate.seconds = static_cast<std::uint64_t>(std::ceil(size_mib / effective));
    estimate.cost = std::round(size_gib * cost_per_gb * 10000.0) / 10000.0;
    return estimate;
}

} // namespace edgexfer::transfer
