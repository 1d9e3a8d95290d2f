#include <allocsim/io/scenario_generation.hpp>

#include <allocsim/algo/allocation_engine.hpp>
#include <allocsim/algo/run_auditor.hpp>
#include <allocsim/core/error.hpp>
#include <allocsim/io/metrics.hpp>

#include <gtest/gtest.h>

#include <regex>
#include <set>

using namespace allocsim::io;
using namespace allocsim::core;
using namespace std::chrono;

class ScenarioGenerationTest : public ::testing::Test {
protected:
    std::mt19937 rng{42};  // Fixed seed for reproducibility
};

// =============================================================================
// ISO week helpers
// =============================================================================

TEST_F(ScenarioGenerationTest, IsoWeekOfDates) {
    EXPECT_EQ(iso_week_key(sys_days{2026y / January / 1}), 202601);
    EXPECT_EQ(iso_week_key(sys_days{2024y / December / 30}), 202501);
    EXPECT_EQ(iso_week_key(sys_days{2027y / January / 1}), 202653);
    EXPECT_EQ(iso_week_key(sys_days{2026y / March / 16}), 202612);
}

TEST_F(ScenarioGenerationTest, MondayOfIsoWeek) {
    EXPECT_EQ(iso_week_monday(202601), sys_days{2025y / December / 29});
    EXPECT_EQ(iso_week_monday(202653), sys_days{2026y / December / 28});
    EXPECT_THROW((void)iso_week_monday(202553), ValidationError);
    EXPECT_THROW((void)iso_week_monday(202600), ValidationError);
}

TEST_F(ScenarioGenerationTest, FormatDate) {
    EXPECT_EQ(format_date(sys_days{2026y / January / 5}), "2026-01-05");
}

// =============================================================================
// Generation
// =============================================================================

TEST_F(ScenarioGenerationTest, SameSeedSameSnapshot) {
    GenerationParams params;
    params.weeks = 4;
    std::mt19937 rng_a{7};
    std::mt19937 rng_b{7};
    auto first = generate_snapshot(params, rng_a);
    auto second = generate_snapshot(params, rng_b);
    EXPECT_EQ(first.supply, second.supply);
    EXPECT_EQ(first.demand, second.demand);
}

TEST_F(ScenarioGenerationTest, DifferentSeedDifferentSnapshot) {
    GenerationParams params;
    params.weeks = 4;
    std::mt19937 rng_a{1};
    std::mt19937 rng_b{2};
    EXPECT_NE(generate_snapshot(params, rng_a).demand, generate_snapshot(params, rng_b).demand);
}

TEST_F(ScenarioGenerationTest, RowsWithinRanges) {
    GenerationParams params;
    params.weeks = 10;
    auto snapshot = generate_snapshot(params, rng);

    // At most one delivery per subcomponent per day
    EXPECT_LE(snapshot.supply.size(), 2u * 7u * params.weeks);
    EXPECT_LE(snapshot.demand.size(), 7u * params.weeks);
    EXPECT_FALSE(snapshot.demand.empty());

    for (const auto& row : snapshot.supply) {
        EXPECT_GE(row.week, 202601);
        EXPECT_LE(row.week, 202610);
        if (row.product_type == SUBCOMPONENT_A_PRODUCT) {
            EXPECT_GE(row.quantity, SUBCOMPONENT_A_MIN);
            EXPECT_LT(row.quantity, SUBCOMPONENT_A_MAX);
        } else {
            EXPECT_EQ(row.product_type, SUBCOMPONENT_B_PRODUCT);
            EXPECT_GE(row.quantity, SUBCOMPONENT_B_MIN);
            EXPECT_LT(row.quantity, SUBCOMPONENT_B_MAX);
        }
    }

    const std::regex id_pattern("ORD-[0-9A-F]{6}");
    std::set<std::string> ids;
    for (const auto& row : snapshot.demand) {
        EXPECT_TRUE(std::regex_match(row.order_id, id_pattern)) << row.order_id;
        EXPECT_TRUE(ids.insert(row.order_id).second) << "duplicate " << row.order_id;
        EXPECT_NE(params.master.find(row.customer), nullptr);
        EXPECT_EQ(row.product_type, FINISHED_PRODUCT);
        EXPECT_GE(row.quantity, ORDER_MIN);
        EXPECT_LT(row.quantity, ORDER_MAX);
    }
}

TEST_F(ScenarioGenerationTest, CertainDeliveriesEveryDay) {
    GenerationParams params;
    params.weeks = 2;
    params.daily_probability = 1.0;
    auto snapshot = generate_snapshot(params, rng);
    EXPECT_EQ(snapshot.supply.size(), 28u);
    EXPECT_EQ(snapshot.demand.size(), 14u);
    EXPECT_EQ(snapshot.supply.front().delivery_date, "2025-12-29");
}

TEST_F(ScenarioGenerationTest, WeeksCrossYearBoundary) {
    GenerationParams params;
    params.weeks = 3;
    params.first_week = 202652;
    params.daily_probability = 1.0;
    auto scenario = generate_scenario(params, rng);

    ASSERT_EQ(scenario.supply.size(), 3u);
    EXPECT_EQ(scenario.supply[0].period, 202652);
    EXPECT_EQ(scenario.supply[1].period, 202653);
    EXPECT_EQ(scenario.supply[2].period, 202701);
}

TEST_F(ScenarioGenerationTest, InvalidParametersRejected) {
    GenerationParams params;
    params.first_week = 202554;
    EXPECT_THROW((void)generate_snapshot(params, rng), ValidationError);

    params.first_week = 202601;
    params.daily_probability = 1.5;
    EXPECT_THROW((void)generate_snapshot(params, rng), ValidationError);

    params.daily_probability = 0.9;
    params.master = CustomerMaster{};
    EXPECT_THROW((void)generate_snapshot(params, rng), ValidationError);
}

TEST_F(ScenarioGenerationTest, GeneratedScenarioRunsCleanly) {
    GenerationParams params;
    params.weeks = 12;
    auto scenario = generate_scenario(params, rng);
    EXPECT_LE(scenario.supply.size(), 12u);

    allocsim::algo::AllocationEngine engine;
    auto run = engine.run(scenario.supply, scenario.orders);
    EXPECT_TRUE(allocsim::algo::audit_run(run).empty());

    auto metrics = compute_metrics(run.summaries, run.results);
    EXPECT_EQ(metrics.orders, scenario.orders.size());
    EXPECT_LE(metrics.overall.allocated, metrics.overall.ordered);
}
