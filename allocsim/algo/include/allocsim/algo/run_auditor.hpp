#pragma once

#include <allocsim/algo/allocation_engine.hpp>

#include <allocsim/core/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace allocsim::algo {

/// @brief Property of a finished run that the auditor checks.
/// @ingroup algo_audit
enum class AuditRule {
    Bounds,           ///< 0 <= qty_allocated <= qty_ordered, status matches quantities.
    PeriodLimit,      ///< Units granted in a period never exceed its global limit.
    LimitUsage,       ///< The limit is used up whenever unmet demand can absorb it.
    TierPrecedence,   ///< No lower tier is served while a higher tier is still short.
    FifoPrecedence,   ///< No newer order is served while an older one in its tier is short.
    Monotonicity,     ///< Cumulative allocation never decreases, identity never changes.
    Carry,            ///< Every unmet order reappears in the next period.
    Conservation      ///< Final order state agrees with the reported rows.
};

/// @brief Label of an audit rule.
[[nodiscard]] std::string_view to_string(AuditRule rule) noexcept;

/// @brief One broken property found in a run.
/// @ingroup algo_audit
struct InvariantViolation {
    AuditRule rule{AuditRule::Bounds};
    core::Period period{0};
    std::string order_id;  ///< Empty for period-level rules.
    std::string message;
};

/// @brief Re-check a finished run against the allocation invariants.
///
/// The check only reads the run's summaries, result rows and final order
/// states, so it also works on runs loaded back from a report.
///
/// @param run The run to audit.
/// @return Every violation found; empty for a sound run.
/// @throws core::OverflowError if the quantities of a corrupt run overflow
///         when summed.
/// @ingroup algo_audit
[[nodiscard]] std::vector<InvariantViolation> audit_run(const AllocationRun& run);

} // namespace allocsim::algo
