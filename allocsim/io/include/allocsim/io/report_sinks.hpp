#pragma once

/// @file report_sinks.hpp
/// @brief Concrete ReportSink implementations for allocation output.
///
/// Provides several sinks that implement the @ref core::ReportSink
/// interface: a no-op sink for benchmarking, a JSON document sink, a flat
/// CSV report, an in-memory buffer for post-processing, and a
/// human-readable textual sink.
///
/// @ingroup io_writers

#include <allocsim/core/report_sink.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <ostream>
#include <vector>

namespace allocsim::io {

/// @brief Report sink that silently discards all output.
///
/// Useful when only the returned AllocationRun is needed.
///
/// @ingroup io_writers
/// @see core::ReportSink
class NullReportSink : public core::ReportSink {
public:
    void begin_period(core::Period period) override;
    void write_result(const core::AllocationResult& result) override;
    void write_summary(const core::PeriodSummary& summary) override;
    void end_period() override;
};

/// @brief Report sink that buffers results and summaries in memory.
///
/// Ideal for unit tests and metrics, where the output must be inspected
/// programmatically.
///
/// @ingroup io_writers
/// @see compute_metrics
class MemoryReportSink : public core::ReportSink {
public:
    void begin_period(core::Period period) override;
    void write_result(const core::AllocationResult& result) override;
    void write_summary(const core::PeriodSummary& summary) override;
    void end_period() override;

    /// @brief Periods in the order they were opened.
    [[nodiscard]] const std::vector<core::Period>& periods() const { return periods_; }

    /// @brief Every result row received, in arrival order.
    [[nodiscard]] const std::vector<core::AllocationResult>& results() const { return results_; }

    /// @brief Every summary received, in arrival order.
    [[nodiscard]] const std::vector<core::PeriodSummary>& summaries() const { return summaries_; }

    /// @brief Number of periods that were opened but not yet closed.
    [[nodiscard]] std::size_t open_periods() const noexcept { return open_; }

    /// @brief Discard everything buffered.
    void clear();

private:
    std::vector<core::Period> periods_;
    std::vector<core::AllocationResult> results_;
    std::vector<core::PeriodSummary> summaries_;
    std::size_t open_{0};
};

/// @brief Report sink that writes the whole run as one JSON document.
///
/// Layout: `{"periods": [{"period": ..., "orders": [...], <summary fields>,
/// "tiers": [...]}]}`. Call @ref finalize to close the document once the
/// run is complete.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::ReportSink, CsvReportSink, TextualReportSink
class JsonReportSink : public core::ReportSink {
public:
    /// @brief Construct a JSON sink targeting @p output.
    /// @param output  Destination stream (must outlive this sink).
    explicit JsonReportSink(std::ostream& output);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonReportSink() override;

    JsonReportSink(const JsonReportSink&) = delete;
    JsonReportSink& operator=(const JsonReportSink&) = delete;
    JsonReportSink(JsonReportSink&&) = delete;
    JsonReportSink& operator=(JsonReportSink&&) = delete;

    void begin_period(core::Period period) override;
    void write_result(const core::AllocationResult& result) override;
    void write_summary(const core::PeriodSummary& summary) override;
    void end_period() override;

    /// @brief Close the periods array and the root object.
    ///
    /// Must be called once after the last period. The destructor calls
    /// this automatically if it has not been invoked.
    void finalize();

private:
    void close_orders();

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    bool orders_open_{false};
    bool finalized_{false};
};

/// @brief Report sink that writes a flat CSV allocation report.
///
/// One row per order per period with the columns
/// `period,order_id,customer_id,segment,priority_tier,period_requested,
/// qty_ordered,qty_allocated,qty_allocated_this_period,status`. When a
/// summary stream is given, one row per period is written there as well.
///
/// @ingroup io_writers
class CsvReportSink : public core::ReportSink {
public:
    /// @brief Construct a CSV sink.
    /// @param results  Stream receiving the per-order rows.
    /// @param summary  Stream receiving the per-period rows, or nullptr.
    explicit CsvReportSink(std::ostream& results, std::ostream* summary = nullptr);

    CsvReportSink(const CsvReportSink&) = delete;
    CsvReportSink& operator=(const CsvReportSink&) = delete;
    CsvReportSink(CsvReportSink&&) = delete;
    CsvReportSink& operator=(CsvReportSink&&) = delete;

    void begin_period(core::Period period) override;
    void write_result(const core::AllocationResult& result) override;
    void write_summary(const core::PeriodSummary& summary) override;
    void end_period() override;

private:
    std::ostream& results_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::ostream* summary_;
};

/// @brief Human-readable textual report.
///
/// Prints a banner per period, one aligned line per order and a closing
/// summary line with the limit breakdown and tier shares.
///
/// @ingroup io_writers
class TextualReportSink : public core::ReportSink {
public:
    /// @brief Construct a textual sink targeting @p output.
    /// @param output  Destination stream (must outlive this sink).
    explicit TextualReportSink(std::ostream& output);

    TextualReportSink(const TextualReportSink&) = delete;
    TextualReportSink& operator=(const TextualReportSink&) = delete;
    TextualReportSink(TextualReportSink&&) = delete;
    TextualReportSink& operator=(TextualReportSink&&) = delete;

    void begin_period(core::Period period) override;
    void write_result(const core::AllocationResult& result) override;
    void write_summary(const core::PeriodSummary& summary) override;
    void end_period() override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace allocsim::io
