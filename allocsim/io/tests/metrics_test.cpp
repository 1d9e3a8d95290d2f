#include <allocsim/io/metrics.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace allocsim::io;
using namespace allocsim::core;

class MetricsTest : public ::testing::Test {
protected:
    static PeriodSummary summary(Period period, ConstrainingInput input, Quantity reserved = 0) {
        PeriodSummary result;
        result.period = period;
        result.constraining_input = input;
        result.reserved = reserved;
        return result;
    }

    std::vector<PeriodSummary> summaries_{
        summary(1, ConstrainingInput::SubcomponentA),
        summary(2, ConstrainingInput::Lookahead, 7),
        summary(3, ConstrainingInput::SubcomponentB),
    };

    std::vector<AllocationResult> results_{
        {1, "A", "Meta", "Data Center", PriorityTier::P1, 1, 10, 10, 10, OrderStatus::Full},
        {1, "B", "Tesla", "Automotive", PriorityTier::P2, 1, 20, 5, 5, OrderStatus::Partial},
        {2, "B", "Tesla", "Automotive", PriorityTier::P2, 1, 20, 20, 15, OrderStatus::Full},
        {2, "C", "Tesla", "Automotive", PriorityTier::P2, 2, 30, 0, 0, OrderStatus::Unfulfilled},
        {3, "C", "Tesla", "Automotive", PriorityTier::P2, 2, 30, 0, 0, OrderStatus::Unfulfilled},
    };
};

TEST_F(MetricsTest, VolumeAndFillRates) {
    auto metrics = compute_metrics(summaries_, results_);

    EXPECT_EQ(metrics.periods, 3u);
    EXPECT_EQ(metrics.orders, 3u);
    EXPECT_EQ(metrics.overall.ordered, 60u);
    EXPECT_EQ(metrics.overall.allocated, 30u);
    EXPECT_DOUBLE_EQ(metrics.overall.rate(), 0.5);
    EXPECT_EQ(metrics.total_open, 30u);

    ASSERT_EQ(metrics.per_tier.size(), 2u);
    EXPECT_DOUBLE_EQ(metrics.per_tier.at(PriorityTier::P1).rate(), 1.0);
    EXPECT_EQ(metrics.per_tier.at(PriorityTier::P2).ordered, 50u);
    EXPECT_EQ(metrics.per_tier.at(PriorityTier::P2).allocated, 20u);

    EXPECT_EQ(metrics.per_customer.at("Tesla").allocated, 20u);
    EXPECT_EQ(metrics.per_customer.at("Meta").allocated, 10u);
}

TEST_F(MetricsTest, ConstraintsAndStatus) {
    auto metrics = compute_metrics(summaries_, results_);

    EXPECT_EQ(metrics.constrained_by_a, 1u);
    EXPECT_EQ(metrics.constrained_by_b, 1u);
    EXPECT_EQ(metrics.constrained_by_lookahead, 1u);
    EXPECT_EQ(metrics.total_reserved, 7u);

    EXPECT_EQ(metrics.full, 2u);
    EXPECT_EQ(metrics.partial, 0u);
    EXPECT_EQ(metrics.unfulfilled, 1u);
}

TEST_F(MetricsTest, LatencyInScheduleSteps) {
    auto metrics = compute_metrics(summaries_, results_);

    EXPECT_EQ(metrics.latencies, (std::vector<uint64_t>{0, 1}));
    EXPECT_EQ(metrics.latency.count, 2u);
    EXPECT_EQ(metrics.latency.min, 0u);
    EXPECT_EQ(metrics.latency.max, 1u);
    EXPECT_DOUBLE_EQ(metrics.latency.mean, 0.5);
    EXPECT_DOUBLE_EQ(metrics.latency.median, 0.5);
}

TEST_F(MetricsTest, LatencyCountsStepsNotPeriodDistance) {
    std::vector<PeriodSummary> summaries{
        summary(202601, ConstrainingInput::SubcomponentA),
        summary(202652, ConstrainingInput::SubcomponentA),
        summary(202701, ConstrainingInput::SubcomponentA),
    };
    std::vector<AllocationResult> results{
        {202701, "X", "C", "S", PriorityTier::P1, 202601, 5, 5, 5, OrderStatus::Full},
    };
    auto metrics = compute_metrics(summaries, results);
    EXPECT_EQ(metrics.latencies, (std::vector<uint64_t>{2}));
}

TEST_F(MetricsTest, LatencyStats) {
    auto stats = compute_latency_stats({3, 1, 2});
    EXPECT_EQ(stats.count, 3u);
    EXPECT_EQ(stats.min, 1u);
    EXPECT_EQ(stats.max, 3u);
    EXPECT_DOUBLE_EQ(stats.mean, 2.0);
    EXPECT_DOUBLE_EQ(stats.median, 2.0);

    auto empty = compute_latency_stats({});
    EXPECT_EQ(empty.count, 0u);
    EXPECT_DOUBLE_EQ(empty.mean, 0.0);
}

TEST_F(MetricsTest, EmptyRun) {
    auto metrics = compute_metrics({}, {});
    EXPECT_EQ(metrics.orders, 0u);
    EXPECT_DOUBLE_EQ(metrics.overall.rate(), 1.0);
    EXPECT_TRUE(metrics.per_tier.empty());
}

TEST_F(MetricsTest, WriteMetricsMentionsEveryTier) {
    auto metrics = compute_metrics(summaries_, results_);
    std::ostringstream oss;
    write_metrics(metrics, oss);

    std::string text = oss.str();
    EXPECT_NE(text.find("Fill rate:"), std::string::npos);
    EXPECT_NE(text.find("50.00%"), std::string::npos);
    EXPECT_NE(text.find("P1:"), std::string::npos);
    EXPECT_NE(text.find("P2:"), std::string::npos);
    EXPECT_NE(text.find("Tesla"), std::string::npos);
    EXPECT_NE(text.find("median"), std::string::npos);
}
