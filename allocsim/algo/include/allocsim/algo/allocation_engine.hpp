#pragma once

#include <allocsim/algo/constraint_resolver.hpp>
#include <allocsim/algo/fifo_distributor.hpp>
#include <allocsim/algo/period_rollover.hpp>
#include <allocsim/algo/waterfall_allocator.hpp>

#include <allocsim/core/allocation_result.hpp>
#include <allocsim/core/backlog.hpp>
#include <allocsim/core/demand_order.hpp>
#include <allocsim/core/period_summary.hpp>
#include <allocsim/core/report_sink.hpp>
#include <allocsim/core/supply_record.hpp>

#include <optional>
#include <vector>

namespace allocsim::algo {

/// @brief Tunables of the allocation engine.
/// @ingroup algo_engine
struct EngineOptions {
    /// Reserve capacity for a forecast next-period deficit.
    bool lookahead{true};
    /// Release units reserved in one period into the next period's limit.
    /// When false, reserved units are not built.
    bool carry_reservation{false};
};

/// @brief Everything a single period needs besides the carried backlog.
/// @ingroup algo_engine
struct PeriodInputs {
    core::SupplyRecord supply;               ///< Supply of the period; its key is the period.
    std::optional<LookaheadForecast> next;   ///< Forecast of the next period, if any.
    std::vector<core::DemandOrder> new_orders;  ///< Orders requested in this period.
    core::Quantity carried_reservation{0};   ///< Reserved by the previous period.
};

/// @brief Result of processing one period.
/// @ingroup algo_engine
struct PeriodOutcome {
    core::PeriodState state;                        ///< Limits and the carried backlog.
    core::PeriodSummary summary;
    std::vector<core::AllocationResult> results;    ///< One row per order in the period.
    std::vector<core::DemandOrder> closed;          ///< Orders that became Full, or arrived Full.
};

/// @brief Result of processing a full schedule of periods.
/// @ingroup algo_engine
struct AllocationRun {
    std::vector<core::PeriodSummary> summaries;     ///< Chronological.
    std::vector<core::AllocationResult> results;    ///< Grouped by period, chronological.
    std::vector<core::DemandOrder> orders;          ///< Final state of every order, by id.
    core::Backlog backlog;                          ///< Orders still open after the last period.
};

/// @brief Orchestrates constraint resolution, waterfall and FIFO per period.
/// @ingroup algo_engine
///
/// Periods are processed strictly in chronological order because the
/// backlog and the lookahead reservation of period t feed period t+1.
/// Within a period the steps run in sequence: admit new orders, resolve the
/// Global Build Limit, split it across tiers, distribute each tier's share
/// oldest-first, report, and roll the unmet remainder over.
///
/// The engine never mutates its inputs. A typical usage pattern is:
///
/// @code
/// algo::AllocationEngine engine;
/// io::MemoryReportSink sink;
/// engine.set_report_sink(&sink);
/// auto run = engine.run(supply, orders);
/// @endcode
///
/// @see ConstraintResolver, WaterfallAllocator, FifoDistributor, PeriodRollover
class AllocationEngine {
public:
    explicit AllocationEngine(EngineOptions options = {});

    /// @brief Options the engine was built with.
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

    /// @brief Set the sink receiving per-period output.
    ///
    /// The engine does not own the sink. Pass nullptr to disable reporting.
    /// @param sink Pointer to a ReportSink, or nullptr.
    void set_report_sink(core::ReportSink* sink) noexcept { sink_ = sink; }

    /// @brief Process a single period.
    ///
    /// New orders that are already Full (a restored, completed order) skip
    /// the backlog and go straight to PeriodOutcome::closed without a row.
    ///
    /// @param inputs  Supply, forecast and new orders of the period.
    /// @param backlog Backlog carried from the previous period.
    /// @return The period's outcome; its state holds the backlog to carry
    ///         into the next period.
    /// @throws ValidationError if a new order duplicates an id in the
    ///         backlog or was requested after the period.
    /// @throws OverflowError if a quantity sum overflows.
    PeriodOutcome run_period(PeriodInputs inputs, core::Backlog backlog) const;

    /// @brief Process every period of a schedule.
    ///
    /// The schedule is the sorted union of the supply periods and the
    /// periods in which orders were requested; a period without a supply
    /// record has zero supply. Orders of @p initial_backlog join in the
    /// first period with their allocation so far.
    ///
    /// @param supply          Supply records, at most one per period.
    /// @param orders          New orders, each admitted in its request period.
    /// @param initial_backlog Open orders carried from an earlier run.
    /// @return Summaries, result rows, final order states and open backlog.
    /// @throws ValidationError on duplicate supply periods or order ids.
    /// @throws OverflowError if a quantity sum overflows.
    [[nodiscard]] AllocationRun run(const std::vector<core::SupplyRecord>& supply,
                                    const std::vector<core::DemandOrder>& orders,
                                    const core::Backlog& initial_backlog = {}) const;

private:
    void report(const PeriodOutcome& outcome) const;

    EngineOptions options_;
    ConstraintResolver resolver_;
    WaterfallAllocator waterfall_;
    FifoDistributor fifo_;
    PeriodRollover rollover_;
    core::ReportSink* sink_{nullptr};
};

} // namespace allocsim::algo
