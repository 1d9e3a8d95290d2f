#include <allocsim/algo/allocation_engine.hpp>
#include <allocsim/algo/run_auditor.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using namespace allocsim::algo;
using namespace allocsim::core;

class RunAuditorTest : public ::testing::Test {
protected:
    static DemandOrder order(const std::string& id, PriorityTier tier, Period period, Quantity qty) {
        return DemandOrder(id, "Cust-" + id, "Segment", tier, period, qty);
    }

    AllocationRun make_run() const {
        std::vector<SupplyRecord> supply{{1, 100, 100}, {2, 50, 60}, {3, 10, 10}};
        std::vector<DemandOrder> orders{
            order("O1", PriorityTier::P1, 1, 50),
            order("O2", PriorityTier::P1, 1, 30),
            order("O3", PriorityTier::P2, 1, 40),
            order("O4", PriorityTier::P5, 2, 70),
            order("O5", PriorityTier::P5, 3, 15),
        };
        return AllocationEngine{}.run(supply, orders);
    }

    static bool has_rule(const std::vector<InvariantViolation>& violations, AuditRule rule) {
        return std::any_of(violations.begin(), violations.end(),
            [rule](const InvariantViolation& v) { return v.rule == rule; });
    }

    static AllocationResult& row(AllocationRun& run, Period period, const std::string& order_id) {
        auto iter = std::find_if(run.results.begin(), run.results.end(),
            [&](const AllocationResult& result) {
                return result.period == period && result.order_id == order_id;
            });
        EXPECT_NE(iter, run.results.end());
        return *iter;
    }
};

TEST_F(RunAuditorTest, EngineRunIsClean) {
    auto run = make_run();
    auto violations = audit_run(run);
    for (const auto& violation : violations) {
        ADD_FAILURE() << to_string(violation.rule) << " at " << violation.period << ": "
                      << violation.message;
    }
}

TEST_F(RunAuditorTest, CarryReservationRunIsClean) {
    std::vector<SupplyRecord> supply{{1, 100, 100}, {2, 20, 20}, {3, 5, 80}};
    std::vector<DemandOrder> orders{
        order("A", PriorityTier::P1, 1, 100),
        order("B", PriorityTier::P2, 2, 50),
        order("C", PriorityTier::P1, 3, 10),
    };
    auto run = AllocationEngine(EngineOptions{true, true}).run(supply, orders);
    EXPECT_TRUE(audit_run(run).empty());
}

TEST_F(RunAuditorTest, EmptyRunIsClean) {
    EXPECT_TRUE(audit_run(AllocationRun{}).empty());
}

TEST_F(RunAuditorTest, OverGrantBreaksPeriodLimit) {
    auto run = make_run();
    auto& o3 = row(run, 1, "O3");
    o3.qty_allocated_this_period += 10;
    o3.qty_allocated += 10;
    o3.status = status_for(o3.qty_allocated, o3.qty_ordered);

    auto violations = audit_run(run);
    EXPECT_TRUE(has_rule(violations, AuditRule::PeriodLimit));
    EXPECT_TRUE(has_rule(violations, AuditRule::LimitUsage));
}

TEST_F(RunAuditorTest, StatusMismatchBreaksBounds) {
    auto run = make_run();
    row(run, 1, "O3").status = OrderStatus::Full;
    auto violations = audit_run(run);
    ASSERT_FALSE(violations.empty());
    EXPECT_EQ(violations.front().rule, AuditRule::Bounds);
    EXPECT_EQ(violations.front().order_id, "O3");
}

TEST_F(RunAuditorTest, LowerTierServedFirstIsDetected) {
    AllocationRun run;
    PeriodSummary summary;
    summary.period = 1;
    summary.base_limit = 100;
    summary.global_limit = 100;
    summary.total_demand = 120;
    summary.total_allocated = 100;
    run.summaries.push_back(summary);
    run.results = {
        {1, "O1", "C", "S", PriorityTier::P1, 1, 50, 30, 30, OrderStatus::Partial},
        {1, "O2", "C", "S", PriorityTier::P1, 1, 30, 30, 30, OrderStatus::Full},
        {1, "O3", "C", "S", PriorityTier::P2, 1, 40, 40, 40, OrderStatus::Full},
    };

    auto violations = audit_run(run);
    EXPECT_TRUE(has_rule(violations, AuditRule::TierPrecedence));
    EXPECT_TRUE(has_rule(violations, AuditRule::FifoPrecedence));
    EXPECT_FALSE(has_rule(violations, AuditRule::PeriodLimit));
}

TEST_F(RunAuditorTest, DroppedOrderBreaksCarry) {
    auto run = make_run();
    auto& o3 = row(run, 2, "O3");
    o3.order_id = "O3-renamed";
    auto violations = audit_run(run);
    EXPECT_TRUE(has_rule(violations, AuditRule::Carry));
}

TEST_F(RunAuditorTest, ShrinkingAllocationBreaksMonotonicity) {
    auto run = make_run();
    auto& o3 = row(run, 2, "O3");
    o3.qty_allocated -= 5;
    o3.status = status_for(o3.qty_allocated, o3.qty_ordered);
    auto violations = audit_run(run);
    EXPECT_TRUE(has_rule(violations, AuditRule::Monotonicity));
}

TEST_F(RunAuditorTest, FinalOrderMismatchBreaksConservation) {
    auto run = make_run();
    auto iter = std::find_if(run.orders.begin(), run.orders.end(),
        [](const DemandOrder& o) { return o.order_id() == "O1"; });
    ASSERT_NE(iter, run.orders.end());
    *iter = DemandOrder("O1", "Cust-O1", "Segment", PriorityTier::P1, 1, 50, 10);

    auto violations = audit_run(run);
    EXPECT_TRUE(has_rule(violations, AuditRule::Conservation));
}

TEST_F(RunAuditorTest, OverflowingPeriodGrantsThrow) {
    auto run = make_run();
    constexpr auto huge = std::numeric_limits<Quantity>::max();
    row(run, 1, "O1").qty_allocated_this_period = huge;
    row(run, 1, "O2").qty_allocated_this_period = huge;

    EXPECT_THROW((void)audit_run(run), OverflowError);
}

TEST_F(RunAuditorTest, RuleNames) {
    EXPECT_EQ(to_string(AuditRule::Bounds), "bounds");
    EXPECT_EQ(to_string(AuditRule::TierPrecedence), "tier_precedence");
    EXPECT_EQ(to_string(AuditRule::Conservation), "conservation");
}
