#pragma once

#include <allocsim/core/period_summary.hpp>
#include <allocsim/core/supply_record.hpp>
#include <allocsim/core/types.hpp>

#include <optional>

namespace allocsim::algo {

/// @brief What is already known about the next scheduled period.
/// @ingroup algo_resolver
struct LookaheadForecast {
    core::Quantity demand{0};  ///< New demand requested in the next period.
    core::Quantity supply{0};  ///< Buildable units forecast for the next period.

    /// @brief Shortfall of supply against demand (0 if none).
    [[nodiscard]] constexpr core::Quantity deficit() const noexcept {
        return demand > supply ? demand - supply : 0;
    }
};

/// @brief Global Build Limit of a period and how it was derived.
/// @ingroup algo_resolver
struct ResolvedLimit {
    core::Quantity base_limit{0};    ///< min(A, B) plus any carried reservation.
    core::Quantity reserved{0};      ///< Held back for the next period's deficit.
    core::Quantity global_limit{0};  ///< base_limit - reserved.
    core::ConstrainingInput constraining_input{core::ConstrainingInput::SubcomponentA};

    constexpr bool operator==(const ResolvedLimit& rhs) const noexcept = default;
};

/// @brief Derives a period's Global Build Limit from its supply signals.
/// @ingroup algo_resolver
///
/// The base limit is the weaker of the two subcomponent supplies. When the
/// next period is forecast to be short by a deficit D, up to D units of the
/// current period's capacity are reserved ahead of time, never more than
/// the base limit itself. The result is a pure function of the inputs.
///
/// @see LookaheadForecast, AllocationEngine
class ConstraintResolver {
public:
    /// @brief Construct a resolver.
    /// @param lookahead_enabled If false, forecasts are ignored and nothing
    ///                          is ever reserved.
    explicit ConstraintResolver(bool lookahead_enabled = true) noexcept
        : lookahead_enabled_(lookahead_enabled) {}

    /// @brief Whether forecasts are taken into account.
    [[nodiscard]] bool lookahead_enabled() const noexcept { return lookahead_enabled_; }

    /// @brief Compute the Global Build Limit of a period.
    ///
    /// @param supply     Supply landing in the current period.
    /// @param next       Forecast for the next scheduled period, or
    ///                   std::nullopt for the last period.
    /// @param carried_in Units reserved in the previous period and released
    ///                   into this one (0 unless reservation carry is on).
    /// @return The limit and its derivation.
    /// @throws OverflowError if the base limit plus @p carried_in overflows.
    [[nodiscard]] ResolvedLimit resolve(const core::SupplyRecord& supply,
                                        const std::optional<LookaheadForecast>& next,
                                        core::Quantity carried_in = 0) const;

private:
    bool lookahead_enabled_;
};

} // namespace allocsim::algo
