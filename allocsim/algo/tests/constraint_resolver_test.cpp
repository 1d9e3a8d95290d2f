#include <allocsim/algo/constraint_resolver.hpp>

#include <allocsim/core/error.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace allocsim::algo;
using namespace allocsim::core;

class ConstraintResolverTest : public ::testing::Test {
protected:
    ConstraintResolver resolver_;
};

// =============================================================================
// Base limit
// =============================================================================

TEST_F(ConstraintResolverTest, WeakerSubcomponentBindsLimit) {
    auto limit = resolver_.resolve(SupplyRecord{1, 120, 100}, std::nullopt);
    EXPECT_EQ(limit.base_limit, 100u);
    EXPECT_EQ(limit.reserved, 0u);
    EXPECT_EQ(limit.global_limit, 100u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::SubcomponentB);
}

TEST_F(ConstraintResolverTest, TieGoesToSubcomponentA) {
    auto limit = resolver_.resolve(SupplyRecord{1, 80, 80}, std::nullopt);
    EXPECT_EQ(limit.global_limit, 80u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::SubcomponentA);
}

TEST_F(ConstraintResolverTest, ZeroSupplyGivesZeroLimit) {
    auto limit = resolver_.resolve(SupplyRecord{1, 0, 500}, LookaheadForecast{100, 0});
    EXPECT_EQ(limit.base_limit, 0u);
    EXPECT_EQ(limit.reserved, 0u);
    EXPECT_EQ(limit.global_limit, 0u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::SubcomponentA);
}

TEST_F(ConstraintResolverTest, CarriedReservationExtendsBase) {
    auto limit = resolver_.resolve(SupplyRecord{2, 50, 60}, std::nullopt, 30);
    EXPECT_EQ(limit.base_limit, 80u);
    EXPECT_EQ(limit.global_limit, 80u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::SubcomponentA);
}

TEST_F(ConstraintResolverTest, CarriedReservationOverflowThrows) {
    auto max = std::numeric_limits<Quantity>::max();
    EXPECT_THROW((void)resolver_.resolve(SupplyRecord{1, max, max}, std::nullopt, 1),
                 OverflowError);
}

// =============================================================================
// Lookahead reservation
// =============================================================================

TEST_F(ConstraintResolverTest, ForecastDeficitIsReserved) {
    auto limit = resolver_.resolve(SupplyRecord{1, 100, 100}, LookaheadForecast{150, 100});
    EXPECT_EQ(limit.base_limit, 100u);
    EXPECT_EQ(limit.reserved, 50u);
    EXPECT_EQ(limit.global_limit, 50u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::Lookahead);
}

TEST_F(ConstraintResolverTest, NoDeficitReservesNothing) {
    auto limit = resolver_.resolve(SupplyRecord{1, 100, 90}, LookaheadForecast{40, 100});
    EXPECT_EQ(limit.reserved, 0u);
    EXPECT_EQ(limit.global_limit, 90u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::SubcomponentB);
}

TEST_F(ConstraintResolverTest, ZeroForecastReservesNothing) {
    auto limit = resolver_.resolve(SupplyRecord{1, 100, 100}, LookaheadForecast{0, 0});
    EXPECT_EQ(limit.reserved, 0u);
    EXPECT_EQ(limit.global_limit, 100u);
}

TEST_F(ConstraintResolverTest, ReservationCappedAtBase) {
    auto limit = resolver_.resolve(SupplyRecord{1, 100, 100}, LookaheadForecast{600, 100});
    EXPECT_EQ(limit.reserved, 100u);
    EXPECT_EQ(limit.global_limit, 0u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::Lookahead);
}

TEST_F(ConstraintResolverTest, DisabledLookaheadIgnoresForecast) {
    ConstraintResolver resolver(false);
    EXPECT_FALSE(resolver.lookahead_enabled());
    auto limit = resolver.resolve(SupplyRecord{1, 100, 100}, LookaheadForecast{150, 100});
    EXPECT_EQ(limit.reserved, 0u);
    EXPECT_EQ(limit.global_limit, 100u);
    EXPECT_EQ(limit.constraining_input, ConstrainingInput::SubcomponentA);
}

TEST_F(ConstraintResolverTest, DeficitComputation) {
    EXPECT_EQ((LookaheadForecast{150, 100}.deficit()), 50u);
    EXPECT_EQ((LookaheadForecast{100, 150}.deficit()), 0u);
    EXPECT_EQ((LookaheadForecast{0, 0}.deficit()), 0u);
}
