#pragma once

/// @file metrics.hpp
/// @brief Post-run allocation metrics.
///
/// Defines data structures for aggregated allocation statistics (fill
/// rates, constraint counts, fulfilment latency) and the functions that
/// derive them from the summaries and result rows of a run.
///
/// @ingroup io_metrics

#include <allocsim/core/allocation_result.hpp>
#include <allocsim/core/period_summary.hpp>
#include <allocsim/core/priority_tier.hpp>
#include <allocsim/core/types.hpp>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace allocsim::io {

/// @brief Ordered versus allocated quantity of a group of orders.
/// @ingroup io_metrics
struct FillRate {
    core::Quantity ordered{0};
    core::Quantity allocated{0};

    /// @brief allocated / ordered, or 1.0 when nothing was ordered.
    [[nodiscard]] double rate() const noexcept {
        return ordered == 0 ? 1.0 : static_cast<double>(allocated) / static_cast<double>(ordered);
    }
};

/// @brief Summary statistics of fulfilment latencies.
///
/// Latency is measured in schedule steps, from the period an order was
/// requested to the period in which it became Full.
///
/// @ingroup io_metrics
/// @see compute_latency_stats
struct LatencyStats {
    std::size_t count{0};  ///< Number of orders that became Full.
    uint64_t min{0};
    uint64_t max{0};
    double mean{0.0};
    double median{0.0};
};

/// @brief Aggregated metrics of one allocation run.
///
/// @ingroup io_metrics
/// @see compute_metrics
struct AllocationMetrics {
    // -- Volume --------------------------------------------------------------

    uint64_t periods{0};           ///< Periods processed.
    uint64_t orders{0};            ///< Distinct orders reported.
    FillRate overall;              ///< All orders, final state.
    core::Quantity total_open{0};  ///< Units still owed at the end of the run.

    /// @brief Fill rate per tier, tiers without orders omitted.
    std::map<core::PriorityTier, FillRate> per_tier;
    /// @brief Fill rate per customer.
    std::map<std::string, FillRate> per_customer;

    // -- Constraints ---------------------------------------------------------

    uint64_t constrained_by_a{0};
    uint64_t constrained_by_b{0};
    uint64_t constrained_by_lookahead{0};
    core::Quantity total_reserved{0};

    // -- Final status --------------------------------------------------------

    uint64_t unfulfilled{0};
    uint64_t partial{0};
    uint64_t full{0};

    // -- Latency -------------------------------------------------------------

    /// @brief Steps to fulfilment of each order that became Full.
    std::vector<uint64_t> latencies;
    LatencyStats latency;
};

/// @brief Compute metrics from a run's summaries and result rows.
///
/// The final state of an order is its last result row. The schedule is
/// the sequence of summary periods; an order requested before the first
/// period counts its latency from the first period.
///
/// @param summaries  Period summaries in chronological order.
/// @param results    Result rows grouped by period, chronological.
/// @return Populated AllocationMetrics.
///
/// @see MemoryReportSink
AllocationMetrics compute_metrics(const std::vector<core::PeriodSummary>& summaries,
                                  const std::vector<core::AllocationResult>& results);

/// @brief Summary statistics of a set of latencies (all zero if empty).
LatencyStats compute_latency_stats(const std::vector<uint64_t>& latencies);

/// @brief Print metrics as aligned `key: value` lines.
void write_metrics(const AllocationMetrics& metrics, std::ostream& out);

} // namespace allocsim::io
