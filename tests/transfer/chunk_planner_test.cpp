#include "edgexfer/transfer/chunk_planner.hpp"

#include <gtest/gtest.h>

using namespace edgexfer::transfer;
using edgexfer::ErrorKind;

TEST(ChunkPlannerTest, OneGibibyteAcrossFiveEdges) {
    ChunkPlanner planner;
    auto plan = planner.plan(kGiB, 5);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value().chunk_size, 50 * kMiB);
    EXPECT_EQ(plan.value().total_chunks, 21u);
    EXPECT_EQ(plan.value().parallelism, 24u);
}

TEST(ChunkPlannerTest, ChunkSizeFollowsBands) {
    ChunkPlanner planner;
    EXPECT_EQ(planner.chunk_size_for(1), 10 * kMiB);
    EXPECT_EQ(planner.chunk_size_for(100 * kMiB - 1), 10 * kMiB);
    EXPECT_EQ(planner.chunk_size_for(100 * kMiB), 50 * kMiB);
    EXPECT_EQ(planner.chunk_size_for(10 * kGiB - 1), 50 * kMiB);
    EXPECT_EQ(planner.chunk_size_for(10 * kGiB), 100 * kMiB);
    EXPECT_EQ(planner.chunk_size_for(500 * kGiB), 100 * kMiB);
}

TEST(ChunkPlannerTest, ChunkSizeNeverShrinksAsFilesGrow) {
    ChunkPlanner planner;
    std::uint64_t previous = 0;
    for (std::uint64_t size = kMiB; size <= 64 * kGiB; size *= 2) {
        const auto chunk = planner.chunk_size_for(size);
        EXPECT_GE(chunk, previous) << "size=" << size;
        previous = chunk;
    }
}

TEST(ChunkPlannerTest, ParallelismScalesWithEdgesUpToCap) {
    ChunkPlanner planner;
    EXPECT_EQ(planner.parallelism_for(0), 6u);
    EXPECT_EQ(planner.parallelism_for(1), 6u);
    EXPECT_EQ(planner.parallelism_for(3), 18u);
    EXPECT_EQ(planner.parallelism_for(4), 24u);
    EXPECT_EQ(planner.parallelism_for(20), 24u);
}

TEST(ChunkPlannerTest, ChunksCoverFileExactly) {
    ChunkPlanner planner;
    const std::uint64_t size = 250 * kMiB + 17;
    auto plan = planner.plan(size, 2);
    ASSERT_TRUE(plan.is_ok());
    const auto& p = plan.value();

    std::uint64_t covered = 0;
    for (std::uint32_t i = 0; i < p.total_chunks; ++i) {
        EXPECT_EQ(p.chunk_offset(i), covered);
        covered += p.chunk_length(i);
    }
    EXPECT_EQ(covered, size);
    EXPECT_EQ(p.chunk_length(p.total_chunks - 1), 17u);
    EXPECT_EQ(p.chunk_length(p.total_chunks), 0u);
}

TEST(ChunkPlannerTest, EmptyFileIsRejected) {
    ChunkPlanner planner;
    auto plan = planner.plan(0, 3);
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().kind, ErrorKind::InvalidArgument);
}

TEST(ChunkPlannerTest, CustomBandsAreSorted) {
    PlannerOptions options;
    options.bands = {{kGiB, 4 * kMiB}, {kMiB, 1024}};
    ChunkPlanner planner(options);
    EXPECT_EQ(planner.chunk_size_for(1000), 1024u);
    EXPECT_EQ(planner.chunk_size_for(10 * kMiB), 4 * kMiB);
}

TEST(ChunkPlannerTest, EstimateUsesAverageBandwidth) {
    ChunkPlanner planner;
    auto plan = planner.plan(kGiB, 1);
    ASSERT_TRUE(plan.is_ok());

    // 1024 MiB over 6 streams of 100 Mbps at 80% efficiency.
    const auto estimate = planner.estimate(plan.value(), {50.0, 150.0}, 0.02);
    EXPECT_EQ(estimate.seconds, 3u);
    EXPECT_DOUBLE_EQ(estimate.cost, 0.02);

    const auto fallback = planner.estimate(plan.value(), {}, 0.0);
    EXPECT_EQ(fallback.seconds, 1u);
    EXPECT_DOUBLE_EQ(fallback.cost, 0.0);
}
