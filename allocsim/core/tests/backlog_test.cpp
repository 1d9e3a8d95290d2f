#include <allocsim/core/backlog.hpp>
#include <allocsim/core/error.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace allocsim::core;

class BacklogTest : public ::testing::Test {
protected:
    static DemandOrder order(const std::string& id, PriorityTier tier, Quantity qty,
                             Period period = 1) {
        return DemandOrder(id, "C-" + id, "Segment", tier, period, qty);
    }
};

TEST_F(BacklogTest, EmptyByDefault) {
    Backlog backlog;
    EXPECT_TRUE(backlog.empty());
    EXPECT_EQ(backlog.size(), 0u);
    EXPECT_EQ(backlog.total_demand(), 0u);
}

TEST_F(BacklogTest, AddKeepsInsertionOrder) {
    Backlog backlog;
    backlog.add(order("A", PriorityTier::P1, 10));
    backlog.add(order("B", PriorityTier::P3, 20));

    EXPECT_EQ(backlog.size(), 2u);
    EXPECT_TRUE(backlog.contains("A"));
    EXPECT_FALSE(backlog.contains("Z"));
    ASSERT_EQ(backlog.orders().size(), 2u);
    EXPECT_EQ(backlog.orders()[1].order_id(), "B");
    EXPECT_EQ(backlog.orders()[1].qty_ordered(), 20u);
}

TEST_F(BacklogTest, DuplicateIdRejected) {
    Backlog backlog;
    backlog.add(order("A", PriorityTier::P1, 10));
    EXPECT_THROW(backlog.add(order("A", PriorityTier::P2, 5)), ValidationError);
    EXPECT_EQ(backlog.size(), 1u);
}

TEST_F(BacklogTest, FullOrderRejected) {
    Backlog backlog;
    EXPECT_THROW(backlog.add(DemandOrder("A", "C", "S", PriorityTier::P1, 1, 10, 10)),
                 ValidationError);
}

TEST_F(BacklogTest, DemandPerTier) {
    Backlog backlog;
    backlog.add(order("A", PriorityTier::P1, 10));
    backlog.add(order("B", PriorityTier::P1, 15));
    backlog.add(DemandOrder("C", "C", "S", PriorityTier::P4, 1, 40, 30));

    EXPECT_EQ(backlog.total_demand(), 35u);

    auto by_tier = backlog.demand_by_tier();
    EXPECT_EQ(by_tier[tier_index(PriorityTier::P1)], 25u);
    EXPECT_EQ(by_tier[tier_index(PriorityTier::P4)], 10u);
    EXPECT_EQ(by_tier[tier_index(PriorityTier::P9)], 0u);
}

TEST_F(BacklogTest, TierOrdersKeepInsertionOrder) {
    Backlog backlog;
    backlog.add(order("B", PriorityTier::P2, 5));
    backlog.add(order("X", PriorityTier::P1, 5));
    backlog.add(order("A", PriorityTier::P2, 5));

    auto p2 = backlog.tier_orders(PriorityTier::P2);
    ASSERT_EQ(p2.size(), 2u);
    EXPECT_EQ(p2[0]->order_id(), "B");
    EXPECT_EQ(p2[1]->order_id(), "A");
    EXPECT_TRUE(backlog.tier_orders(PriorityTier::P5).empty());
}

TEST_F(BacklogTest, DemandOverflowThrows) {
    Backlog backlog;
    auto max = std::numeric_limits<Quantity>::max();
    backlog.add(order("A", PriorityTier::P1, max));
    backlog.add(order("B", PriorityTier::P1, 1));
    EXPECT_THROW((void)backlog.total_demand(), OverflowError);
}

TEST_F(BacklogTest, ReleaseEmptiesBacklog) {
    Backlog backlog;
    backlog.add(order("A", PriorityTier::P1, 10));
    auto released = backlog.release();
    ASSERT_EQ(released.size(), 1u);
    EXPECT_TRUE(backlog.empty());
    EXPECT_FALSE(backlog.contains("A"));
    backlog.add(order("A", PriorityTier::P1, 10));
    EXPECT_EQ(backlog.size(), 1u);
}
