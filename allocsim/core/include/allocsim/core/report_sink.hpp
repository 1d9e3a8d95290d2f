#pragma once

#include <allocsim/core/allocation_result.hpp>
#include <allocsim/core/period_summary.hpp>
#include <allocsim/core/types.hpp>

namespace allocsim::core {

/// @brief Abstract interface for receiving allocation output.
/// @ingroup core
///
/// Implementations render the engine's output to a specific format (JSON,
/// CSV, text, memory buffer, etc.). For every period the engine calls:
///   1. begin_period() -- once, before anything else for that period
///   2. write_result() -- once per order in the period's backlog
///   3. write_summary() -- once, after all results
///   4. end_period()   -- once, closing the period
///
/// The AllocationEngine holds an optional pointer to a ReportSink. When no
/// sink is installed the overhead is a single null-pointer check.
///
/// @see AllocationEngine::set_report_sink()
class ReportSink {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~ReportSink() = default;

    /// @brief Open the output of a period.
    /// @param period The period about to be reported.
    virtual void begin_period(Period period) = 0;

    /// @brief Record the end-of-period snapshot of one order.
    /// @param result The order's result row.
    virtual void write_result(const AllocationResult& result) = 0;

    /// @brief Record the period's summary.
    /// @param summary Limit, demand and allocation totals for the period.
    virtual void write_summary(const PeriodSummary& summary) = 0;

    /// @brief Close the output of the current period.
    virtual void end_period() = 0;

protected:
    /// @brief Default constructor (protected -- instantiate subclasses only).
    ReportSink() = default;

    /// @brief Copy constructor (protected).
    ReportSink(const ReportSink&) = default;

    /// @brief Copy-assignment operator (protected).
    /// @return Reference to this sink.
    ReportSink& operator=(const ReportSink&) = default;

    /// @brief Move constructor (protected).
    ReportSink(ReportSink&&) = default;

    /// @brief Move-assignment operator (protected).
    /// @return Reference to this sink.
    ReportSink& operator=(ReportSink&&) = default;
};

} // namespace allocsim::core
