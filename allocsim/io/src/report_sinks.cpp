#include <allocsim/io/report_sinks.hpp>
#include <allocsim/io/csv.hpp>
#include <allocsim/io/period_label.hpp>

#include <array>
#include <iomanip>
#include <string>
#include <string_view>

namespace allocsim::io {

using core::AllocationResult;
using core::Period;
using core::PeriodSummary;

namespace {

template<typename Writer>
void write_string(Writer& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

} // anonymous namespace

// =============================================================================
// NullReportSink
// =============================================================================

void NullReportSink::begin_period(Period /*period*/) {}
void NullReportSink::write_result(const AllocationResult& /*result*/) {}
void NullReportSink::write_summary(const PeriodSummary& /*summary*/) {}
void NullReportSink::end_period() {}

// =============================================================================
// MemoryReportSink
// =============================================================================

void MemoryReportSink::begin_period(Period period) {
    periods_.push_back(period);
    ++open_;
}

void MemoryReportSink::write_result(const AllocationResult& result) {
    results_.push_back(result);
}

void MemoryReportSink::write_summary(const PeriodSummary& summary) {
    summaries_.push_back(summary);
}

void MemoryReportSink::end_period() {
    if (open_ > 0) {
        --open_;
    }
}

void MemoryReportSink::clear() {
    periods_.clear();
    results_.clear();
    summaries_.clear();
    open_ = 0;
}

// =============================================================================
// JsonReportSink
// =============================================================================

JsonReportSink::JsonReportSink(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartObject();
    writer_.Key("periods");
    writer_.StartArray();
}

JsonReportSink::~JsonReportSink() {
    if (!finalized_) {
        finalize();
    }
}

void JsonReportSink::begin_period(Period period) {
    writer_.StartObject();
    writer_.Key("period");
    writer_.Int64(period);
    writer_.Key("label");
    write_string(writer_, format_period(period));
    writer_.Key("orders");
    writer_.StartArray();
    orders_open_ = true;
}

void JsonReportSink::write_result(const AllocationResult& result) {
    writer_.StartObject();
    writer_.Key("order_id");
    write_string(writer_, result.order_id);
    writer_.Key("customer_id");
    write_string(writer_, result.customer_id);
    writer_.Key("segment");
    write_string(writer_, result.segment);
    writer_.Key("priority_tier");
    write_string(writer_, core::to_string(result.priority_tier));
    writer_.Key("period_requested");
    writer_.Int64(result.period_requested);
    writer_.Key("qty_ordered");
    writer_.Uint64(result.qty_ordered);
    writer_.Key("qty_allocated");
    writer_.Uint64(result.qty_allocated);
    writer_.Key("qty_allocated_this_period");
    writer_.Uint64(result.qty_allocated_this_period);
    writer_.Key("status");
    write_string(writer_, core::to_string(result.status));
    writer_.EndObject();
}

void JsonReportSink::close_orders() {
    if (orders_open_) {
        writer_.EndArray();
        orders_open_ = false;
    }
}

void JsonReportSink::write_summary(const PeriodSummary& summary) {
    close_orders();
    writer_.Key("base_limit");
    writer_.Uint64(summary.base_limit);
    writer_.Key("reserved");
    writer_.Uint64(summary.reserved);
    writer_.Key("global_limit");
    writer_.Uint64(summary.global_limit);
    writer_.Key("total_demand");
    writer_.Uint64(summary.total_demand);
    writer_.Key("total_allocated");
    writer_.Uint64(summary.total_allocated);
    writer_.Key("constraining_input");
    write_string(writer_, core::to_string(summary.constraining_input));
    writer_.Key("tiers");
    writer_.StartArray();
    for (const auto& tier : summary.tiers) {
        writer_.StartObject();
        writer_.Key("tier");
        write_string(writer_, core::to_string(tier.tier));
        writer_.Key("demand");
        writer_.Uint64(tier.demand);
        writer_.Key("allocated");
        writer_.Uint64(tier.allocated);
        writer_.EndObject();
    }
    writer_.EndArray();
}

void JsonReportSink::end_period() {
    close_orders();
    writer_.EndObject();
}

void JsonReportSink::finalize() {
    if (!finalized_) {
        writer_.EndArray();
        writer_.EndObject();
        output_ << "\n";
        output_.flush();
        finalized_ = true;
    }
}

// =============================================================================
// CsvReportSink
// =============================================================================

CsvReportSink::CsvReportSink(std::ostream& results, std::ostream* summary)
    : results_(results)
    , summary_(summary) {
    results_ << "period,order_id,customer_id,segment,priority_tier,period_requested,"
                "qty_ordered,qty_allocated,qty_allocated_this_period,status\n";
    if (summary_ != nullptr) {
        *summary_ << "period,base_limit,reserved,global_limit,total_demand,total_allocated,"
                     "constraining_input";
        for (auto tier : core::ALL_TIERS) {
            *summary_ << ",allocated_" << core::to_string(tier);
        }
        *summary_ << "\n";
    }
}

void CsvReportSink::begin_period(Period /*period*/) {}

void CsvReportSink::write_result(const AllocationResult& result) {
    results_ << format_period(result.period) << ',' << csv_escape(result.order_id) << ','
             << csv_escape(result.customer_id) << ',' << csv_escape(result.segment) << ','
             << core::to_string(result.priority_tier) << ','
             << format_period(result.period_requested) << ',' << result.qty_ordered << ','
             << result.qty_allocated << ',' << result.qty_allocated_this_period << ','
             << core::to_string(result.status) << '\n';
}

void CsvReportSink::write_summary(const PeriodSummary& summary) {
    if (summary_ == nullptr) {
        return;
    }
    *summary_ << format_period(summary.period) << ',' << summary.base_limit << ','
              << summary.reserved << ',' << summary.global_limit << ','
              << summary.total_demand << ',' << summary.total_allocated << ','
              << core::to_string(summary.constraining_input);
    std::array<core::Quantity, core::TIER_COUNT> allocated{};
    for (const auto& tier : summary.tiers) {
        allocated[core::tier_index(tier.tier)] = tier.allocated;
    }
    for (auto qty : allocated) {
        *summary_ << ',' << qty;
    }
    *summary_ << '\n';
}

void CsvReportSink::end_period() {
    results_.flush();
}

// =============================================================================
// TextualReportSink
// =============================================================================

TextualReportSink::TextualReportSink(std::ostream& output)
    : output_(output) {}

void TextualReportSink::begin_period(Period period) {
    output_ << "=== " << format_period(period) << " ===\n";
}

void TextualReportSink::write_result(const AllocationResult& result) {
    // Format:   P1  ORD-1A2B3C  Microsoft             req 2026-W01   30/  50 (+10)  Partial
    output_ << "  " << core::to_string(result.priority_tier) << "  "
            << std::setw(12) << std::left << result.order_id << " "
            << std::setw(20) << std::left << result.customer_id << " req "
            << std::setw(9) << std::left << format_period(result.period_requested) << " "
            << std::setw(6) << std::right << result.qty_allocated << "/"
            << std::setw(6) << std::left << result.qty_ordered << " (+"
            << result.qty_allocated_this_period << ")  "
            << core::to_string(result.status) << "\n";
}

void TextualReportSink::write_summary(const PeriodSummary& summary) {
    output_ << "  limit " << summary.global_limit << " (base " << summary.base_limit
            << ", reserved " << summary.reserved << ", bound by "
            << core::to_string(summary.constraining_input) << ")  demand "
            << summary.total_demand << "  allocated " << summary.total_allocated << "\n";
    output_ << "  tiers:";
    for (const auto& tier : summary.tiers) {
        if (tier.demand == 0) {
            continue;
        }
        output_ << " " << core::to_string(tier.tier) << "=" << tier.allocated << "/" << tier.demand;
    }
    output_ << "\n";
}

void TextualReportSink::end_period() {
    output_ << "\n";
}

} // namespace allocsim::io
