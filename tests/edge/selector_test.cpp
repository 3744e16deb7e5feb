#include "edgexfer/edge/selector.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>

using namespace edgexfer::edge;
using edgexfer::ErrorKind;

namespace {

class EdgeSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 55));
        clock_ = [this] { return now_; };
    }

    void add_edge(const std::string& id, GeoPoint location, double latency, double load = 20.0,
                  double bandwidth = 800.0, std::chrono::seconds age = std::chrono::seconds(0)) {
        ASSERT_TRUE(registry_.register_edge(EdgeLocation{id, "https://" + id + ".example", id, "US", "test",
                                                         location, true}).is_ok());
        EdgeMetric metric;
        metric.edge_id = id;
        metric.timestamp = now_ - age;
        metric.latency_ms = latency;
        metric.load_percent = load;
        metric.bandwidth_mbps = bandwidth;
        metric.error_rate = 0.5;
        ASSERT_TRUE(registry_.record_metric(metric).is_ok());
    }

    InMemoryEdgeRegistry registry_;
    edgexfer::core::TimePoint now_;
    edgexfer::core::Clock clock_;
};

const GeoPoint kSanFrancisco{37.7749, -122.4194};
const GeoPoint kLosAngeles{34.0522, -118.2437};
const GeoPoint kLondon{51.5074, -0.1278};

} // namespace

TEST(HaversineTest, KnownDistances) {
    EXPECT_DOUBLE_EQ(haversine_km(kSanFrancisco, kSanFrancisco), 0.0);
    EXPECT_NEAR(haversine_km(kSanFrancisco, kLosAngeles), 559.0, 5.0);
    EXPECT_NEAR(haversine_km(kSanFrancisco, kLondon), 8620.0, 60.0);
}

TEST(ScoringWeightsTest, EveryPrioritySumsToOne) {
    for (auto priority : {Priority::Speed, Priority::Cost, Priority::Balanced}) {
        const auto w = ScoringWeights::for_priority(priority);
        EXPECT_NEAR(w.latency + w.bandwidth + w.load + w.distance + w.error, 1.0, 1e-9) << to_string(priority);
    }
}

TEST(ScoringWeightsTest, PriorityNamesRoundTrip) {
    EXPECT_EQ(priority_from_string("speed").value(), Priority::Speed);
    EXPECT_EQ(priority_from_string("cost").value(), Priority::Cost);
    EXPECT_EQ(priority_from_string("balanced").value(), Priority::Balanced);
    EXPECT_FALSE(priority_from_string("fastest").has_value());
}

TEST_F(EdgeSelectorTest, NearbyLowLatencyEdgeRanksFirst) {
    add_edge("sfo-1", kSanFrancisco, 12.0);
    add_edge("lhr-1", kLondon, 140.0);

    EdgeSelector selector(registry_, {}, clock_);
    auto result = selector.select_edges(100 * 1024 * 1024, kSanFrancisco, Priority::Speed);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].edge.id, "sfo-1");
    EXPECT_GT(result.value()[0].score, result.value()[1].score);
    EXPECT_NEAR(result.value()[0].distance_km, 0.0, 1e-6);
}

TEST_F(EdgeSelectorTest, WeightsSumToOne) {
    add_edge("sfo-1", kSanFrancisco, 12.0);
    add_edge("lax-1", kLosAngeles, 18.0);
    add_edge("lhr-1", kLondon, 140.0);

    EdgeSelector selector(registry_, {}, clock_);
    auto result = selector.select_edges(1024, kSanFrancisco, Priority::Balanced);
    ASSERT_TRUE(result.is_ok());

    double total = 0.0;
    for (const auto& edge : result.value()) {
        EXPECT_GT(edge.weight, 0.0);
        total += edge.weight;
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST_F(EdgeSelectorTest, SelectionIsDeterministic) {
    add_edge("sfo-1", kSanFrancisco, 12.0);
    add_edge("lax-1", kLosAngeles, 18.0);
    add_edge("lhr-1", kLondon, 140.0);

    EdgeSelector selector(registry_, {}, clock_);
    auto first = selector.select_edges(1024, kLosAngeles, Priority::Cost);
    auto second = selector.select_edges(1024, kLosAngeles, Priority::Cost);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    ASSERT_EQ(first.value().size(), second.value().size());
    for (std::size_t i = 0; i < first.value().size(); ++i) {
        EXPECT_EQ(first.value()[i].edge.id, second.value()[i].edge.id);
        EXPECT_DOUBLE_EQ(first.value()[i].score, second.value()[i].score);
    }
}

TEST_F(EdgeSelectorTest, EqualScoresBreakTiesByEdgeId) {
    add_edge("b-edge", kSanFrancisco, 20.0);
    add_edge("a-edge", kSanFrancisco, 20.0);

    EdgeSelector selector(registry_, {}, clock_);
    auto result = selector.select_edges(1024, kSanFrancisco, Priority::Balanced);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()[0].edge.id, "a-edge");
    EXPECT_EQ(result.value()[1].edge.id, "b-edge");
    EXPECT_DOUBLE_EQ(result.value()[0].weight, 0.5);
}

TEST_F(EdgeSelectorTest, StaleInactiveAndExcludedEdgesAreSkipped) {
    add_edge("sfo-1", kSanFrancisco, 12.0);
    add_edge("lax-1", kLosAngeles, 18.0, 20.0, 800.0, std::chrono::minutes(10));
    add_edge("sea-1", {47.6062, -122.3321}, 25.0);
    add_edge("ord-1", {41.8781, -87.6298}, 45.0);
    ASSERT_TRUE(registry_.set_active("sea-1", false).is_ok());

    EdgeSelector selector(registry_, {}, clock_);
    auto result = selector.select_edges(1024, kSanFrancisco, Priority::Speed, {"ord-1"});
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].edge.id, "sfo-1");
    EXPECT_DOUBLE_EQ(result.value()[0].weight, 1.0);
}

TEST_F(EdgeSelectorTest, NoEligibleEdgeIsAnError) {
    add_edge("sfo-1", kSanFrancisco, 12.0, 20.0, 800.0, std::chrono::hours(1));

    EdgeSelector selector(registry_, {}, clock_);
    auto result = selector.select_edges(1024, kSanFrancisco, Priority::Speed);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NoEdgesAvailable);
}

TEST_F(EdgeSelectorTest, ResultIsCappedAtMaxEdges) {
    for (int i = 0; i < 8; ++i) {
        add_edge("edge-" + std::to_string(i), kSanFrancisco, 10.0 + i);
    }

    SelectorOptions options;
    options.max_edges = 3;
    EdgeSelector selector(registry_, options, clock_);
    auto result = selector.select_edges(1024, kSanFrancisco, Priority::Speed);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(result.value()[0].edge.id, "edge-0");
    EXPECT_EQ(result.value()[2].edge.id, "edge-2");
}

TEST_F(EdgeSelectorTest, ScoreStaysInUnitRange) {
    EdgeSelector selector(registry_, {}, clock_);
    EdgeMetric worst;
    worst.latency_ms = 5000.0;
    worst.load_percent = 100.0;
    worst.error_rate = 90.0;
    EdgeMetric best;
    best.bandwidth_mbps = 10000.0;

    const auto weights = ScoringWeights::for_priority(Priority::Balanced);
    EXPECT_DOUBLE_EQ(selector.score(worst, 20000.0, weights), 0.0);
    EXPECT_NEAR(selector.score(best, 0.0, weights), 1.0, 1e-9);
}
