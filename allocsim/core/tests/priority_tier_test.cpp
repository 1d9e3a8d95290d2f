#include <allocsim/core/order_status.hpp>
#include <allocsim/core/priority_tier.hpp>

#include <gtest/gtest.h>

using namespace allocsim::core;

// =============================================================================
// PriorityTier
// =============================================================================

TEST(PriorityTierTest, RankAndIndex) {
    EXPECT_EQ(tier_rank(PriorityTier::P1), 1);
    EXPECT_EQ(tier_rank(PriorityTier::P9), 9);
    EXPECT_EQ(tier_index(PriorityTier::P1), 0u);
    EXPECT_EQ(tier_index(PriorityTier::P9), TIER_COUNT - 1);
}

TEST(PriorityTierTest, LowerRankHasPrecedence) {
    EXPECT_TRUE(has_precedence(PriorityTier::P1, PriorityTier::P2));
    EXPECT_FALSE(has_precedence(PriorityTier::P5, PriorityTier::P3));
    EXPECT_FALSE(has_precedence(PriorityTier::P4, PriorityTier::P4));
}

TEST(PriorityTierTest, AllTiersInPrecedenceOrder) {
    ASSERT_EQ(ALL_TIERS.size(), TIER_COUNT);
    for (std::size_t i = 1; i < ALL_TIERS.size(); ++i) {
        EXPECT_TRUE(has_precedence(ALL_TIERS[i - 1], ALL_TIERS[i]));
    }
}

TEST(PriorityTierTest, ToString) {
    EXPECT_EQ(to_string(PriorityTier::P1), "P1");
    EXPECT_EQ(to_string(PriorityTier::P7), "P7");
}

TEST(PriorityTierTest, ParseAcceptsLabelsAndDigits) {
    EXPECT_EQ(parse_priority_tier("P3"), PriorityTier::P3);
    EXPECT_EQ(parse_priority_tier("p9"), PriorityTier::P9);
    EXPECT_EQ(parse_priority_tier("1"), PriorityTier::P1);
}

TEST(PriorityTierTest, ParseRejectsOutOfRange) {
    EXPECT_FALSE(parse_priority_tier("P0").has_value());
    EXPECT_FALSE(parse_priority_tier("P10").has_value());
    EXPECT_FALSE(parse_priority_tier("").has_value());
    EXPECT_FALSE(parse_priority_tier("P").has_value());
    EXPECT_FALSE(parse_priority_tier("X1").has_value());
    EXPECT_FALSE(parse_priority_tier("99").has_value());
}

TEST(PriorityTierTest, FromRank) {
    EXPECT_EQ(tier_from_rank(4), PriorityTier::P4);
    EXPECT_FALSE(tier_from_rank(0).has_value());
    EXPECT_FALSE(tier_from_rank(10).has_value());
    EXPECT_FALSE(tier_from_rank(-1).has_value());
}

// =============================================================================
// OrderStatus
// =============================================================================

TEST(OrderStatusTest, StatusFromQuantities) {
    EXPECT_EQ(status_for(0, 10), OrderStatus::Unfulfilled);
    EXPECT_EQ(status_for(4, 10), OrderStatus::Partial);
    EXPECT_EQ(status_for(10, 10), OrderStatus::Full);
}

TEST(OrderStatusTest, TransitionsOnlyMoveForward) {
    EXPECT_TRUE(is_valid_transition(OrderStatus::Unfulfilled, OrderStatus::Unfulfilled));
    EXPECT_TRUE(is_valid_transition(OrderStatus::Unfulfilled, OrderStatus::Partial));
    EXPECT_TRUE(is_valid_transition(OrderStatus::Unfulfilled, OrderStatus::Full));
    EXPECT_TRUE(is_valid_transition(OrderStatus::Partial, OrderStatus::Partial));
    EXPECT_TRUE(is_valid_transition(OrderStatus::Partial, OrderStatus::Full));
    EXPECT_FALSE(is_valid_transition(OrderStatus::Partial, OrderStatus::Unfulfilled));
    EXPECT_FALSE(is_valid_transition(OrderStatus::Full, OrderStatus::Full));
    EXPECT_FALSE(is_valid_transition(OrderStatus::Full, OrderStatus::Partial));
}

TEST(OrderStatusTest, ToString) {
    EXPECT_EQ(to_string(OrderStatus::Unfulfilled), "Unfulfilled");
    EXPECT_EQ(to_string(OrderStatus::Partial), "Partial");
    EXPECT_EQ(to_string(OrderStatus::Full), "Full");
}
