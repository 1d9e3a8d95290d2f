#pragma once

#include <allocsim/core/priority_tier.hpp>
#include <allocsim/core/types.hpp>

#include <string_view>
#include <vector>

namespace allocsim::core {

/// @brief Input that bounded a period's Global Build Limit.
/// @ingroup core
enum class ConstrainingInput {
    SubcomponentA,  ///< Subcomponent A was the weaker supply (ties go to A).
    SubcomponentB,  ///< Subcomponent B was the weaker supply.
    Lookahead       ///< Capacity was reserved for a forecast next-period deficit.
};

/// @brief Report label of a constraining input ("A", "B", "lookahead").
[[nodiscard]] constexpr std::string_view to_string(ConstrainingInput input) noexcept {
    switch (input) {
        case ConstrainingInput::SubcomponentA: return "A";
        case ConstrainingInput::SubcomponentB: return "B";
        case ConstrainingInput::Lookahead:     return "lookahead";
    }
    return "?";
}

/// @brief Quantity a tier asked for and received in one period.
/// @ingroup core
struct TierAllocation {
    PriorityTier tier{PriorityTier::P1};
    Quantity demand{0};     ///< Sum of qty_remaining over the tier's backlog.
    Quantity allocated{0};  ///< Share of the global limit given to the tier.

    constexpr bool operator==(const TierAllocation& rhs) const noexcept = default;
};

/// @brief Per-period outcome handed to the reporting sink.
/// @ingroup core
///
/// @see ReportSink::write_summary
struct PeriodSummary {
    Period period{0};
    Quantity base_limit{0};       ///< min(A, B) plus any carried reservation.
    Quantity reserved{0};         ///< Units held back for the next period's deficit.
    Quantity global_limit{0};     ///< base_limit - reserved.
    Quantity total_demand{0};     ///< Unmet demand in the backlog at period start.
    Quantity total_allocated{0};  ///< Units granted this period.
    ConstrainingInput constraining_input{ConstrainingInput::SubcomponentA};
    std::vector<TierAllocation> tiers;  ///< All tiers, highest precedence first.

    bool operator==(const PeriodSummary& rhs) const = default;
};

} // namespace allocsim::core
