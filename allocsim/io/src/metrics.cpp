#include <allocsim/io/metrics.hpp>

#include <allocsim/core/error.hpp>

#include <algorithm>
#include <iomanip>
#include <unordered_map>

namespace allocsim::io {

using namespace allocsim::core;

namespace {

void accumulate(FillRate& rate, const AllocationResult& row) {
    rate.ordered = checked_add(rate.ordered, row.qty_ordered);
    rate.allocated = checked_add(rate.allocated, row.qty_allocated);
}

// Position of the first scheduled period at or after `period`.
uint64_t schedule_step(const std::vector<Period>& schedule, Period period) {
    auto iter = std::lower_bound(schedule.begin(), schedule.end(), period);
    return static_cast<uint64_t>(iter - schedule.begin());
}

} // anonymous namespace

AllocationMetrics compute_metrics(const std::vector<PeriodSummary>& summaries,
                                  const std::vector<AllocationResult>& results) {
    AllocationMetrics metrics;
    metrics.periods = summaries.size();

    std::vector<Period> schedule;
    schedule.reserve(summaries.size());
    for (const auto& summary : summaries) {
        schedule.push_back(summary.period);
        metrics.total_reserved = checked_add(metrics.total_reserved, summary.reserved);
        switch (summary.constraining_input) {
            case ConstrainingInput::SubcomponentA: ++metrics.constrained_by_a; break;
            case ConstrainingInput::SubcomponentB: ++metrics.constrained_by_b; break;
            case ConstrainingInput::Lookahead:     ++metrics.constrained_by_lookahead; break;
        }
    }
    std::sort(schedule.begin(), schedule.end());

    // Last row of each order, plus the period it became Full.
    std::unordered_map<std::string, std::size_t> last_row;
    std::vector<std::string> order_ids;
    for (std::size_t idx = 0; idx < results.size(); ++idx) {
        const auto& row = results[idx];
        auto [iter, inserted] = last_row.try_emplace(row.order_id, idx);
        if (inserted) {
            order_ids.push_back(row.order_id);
        } else {
            iter->second = idx;
        }
        if (row.status == OrderStatus::Full && row.qty_allocated_this_period > 0) {
            uint64_t requested = schedule_step(schedule, row.period_requested);
            uint64_t fulfilled = schedule_step(schedule, row.period);
            metrics.latencies.push_back(fulfilled > requested ? fulfilled - requested : 0);
        }
    }

    metrics.orders = order_ids.size();
    for (const auto& order_id : order_ids) {
        const auto& row = results[last_row.at(order_id)];
        accumulate(metrics.overall, row);
        accumulate(metrics.per_tier[row.priority_tier], row);
        accumulate(metrics.per_customer[row.customer_id], row);
        metrics.total_open = checked_add(metrics.total_open, row.qty_ordered - row.qty_allocated);
        switch (row.status) {
            case OrderStatus::Unfulfilled: ++metrics.unfulfilled; break;
            case OrderStatus::Partial:     ++metrics.partial; break;
            case OrderStatus::Full:        ++metrics.full; break;
        }
    }

    metrics.latency = compute_latency_stats(metrics.latencies);
    return metrics;
}

LatencyStats compute_latency_stats(const std::vector<uint64_t>& latencies) {
    LatencyStats stats;

    if (latencies.empty()) {
        return stats;
    }

    std::vector<uint64_t> sorted = latencies;
    std::sort(sorted.begin(), sorted.end());

    stats.count = sorted.size();
    stats.min = sorted.front();
    stats.max = sorted.back();

    double sum = 0.0;
    for (uint64_t val : sorted) {
        sum += static_cast<double>(val);
    }
    stats.mean = sum / static_cast<double>(sorted.size());

    std::size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 0) {
        stats.median = static_cast<double>(sorted[mid - 1] + sorted[mid]) / 2.0;
    } else {
        stats.median = static_cast<double>(sorted[mid]);
    }
    return stats;
}

void write_metrics(const AllocationMetrics& metrics, std::ostream& out) {
    auto percent = [](const FillRate& rate) {
        return rate.rate() * 100.0;
    };

    out << std::fixed << std::setprecision(2);
    out << "Periods:              " << metrics.periods << "\n";
    out << "Orders:               " << metrics.orders << " (full " << metrics.full
        << ", partial " << metrics.partial << ", unfulfilled " << metrics.unfulfilled << ")\n";
    out << "Ordered:              " << metrics.overall.ordered << "\n";
    out << "Allocated:            " << metrics.overall.allocated << "\n";
    out << "Still open:           " << metrics.total_open << "\n";
    out << "Fill rate:            " << percent(metrics.overall) << "%\n";
    out << "Bound by A/B/lookahead: " << metrics.constrained_by_a << "/"
        << metrics.constrained_by_b << "/" << metrics.constrained_by_lookahead << "\n";
    out << "Reserved:             " << metrics.total_reserved << "\n";

    out << "\nFill rate per tier:\n";
    for (const auto& [tier, rate] : metrics.per_tier) {
        out << "  " << to_string(tier) << ": " << std::setw(7) << percent(rate) << "%  ("
            << rate.allocated << "/" << rate.ordered << ")\n";
    }

    out << "\nFill rate per customer:\n";
    for (const auto& [customer, rate] : metrics.per_customer) {
        out << "  " << std::setw(20) << std::left << customer << std::right << ": "
            << std::setw(7) << percent(rate) << "%  (" << rate.allocated << "/"
            << rate.ordered << ")\n";
    }

    if (metrics.latency.count > 0) {
        out << "\nFulfilment latency (periods):\n";
        out << "  min:    " << metrics.latency.min << "\n";
        out << "  max:    " << metrics.latency.max << "\n";
        out << "  mean:   " << metrics.latency.mean << "\n";
        out << "  median: " << metrics.latency.median << "\n";
    }
}

} // namespace allocsim::io
