#include <allocsim/algo/run_auditor.hpp>

#include <allocsim/core/order_status.hpp>
#include <allocsim/core/priority_tier.hpp>
#include <allocsim/core/types.hpp>

#include <algorithm>
#include <map>
#include <tuple>
#include <unordered_map>

namespace allocsim::algo {

using namespace allocsim::core;

namespace {

using RowsByPeriod = std::map<Period, std::vector<const AllocationResult*>>;

class Auditor {
public:
    explicit Auditor(const AllocationRun& run) : run_(run) {
        for (const auto& result : run_.results) {
            rows_[result.period].push_back(&result);
        }
    }

    std::vector<InvariantViolation> audit() {
        check_bounds();
        check_period_limits();
        for (const auto& [period, rows] : rows_) {
            check_tier_precedence(period, rows);
            check_fifo_precedence(period, rows);
        }
        check_history();
        return std::move(violations_);
    }

private:
    void flag(AuditRule rule, Period period, std::string order_id, std::string message) {
        violations_.push_back(InvariantViolation{rule, period, std::move(order_id), std::move(message)});
    }

    void check_bounds() {
        for (const auto& row : run_.results) {
            if (row.qty_allocated > row.qty_ordered) {
                flag(AuditRule::Bounds, row.period, row.order_id,
                     "allocated " + std::to_string(row.qty_allocated) + " of " +
                         std::to_string(row.qty_ordered) + " ordered");
            } else if (row.status != status_for(row.qty_allocated, row.qty_ordered)) {
                flag(AuditRule::Bounds, row.period, row.order_id,
                     "status " + std::string(to_string(row.status)) + " does not match quantities");
            }
            if (row.qty_allocated_this_period > row.qty_allocated) {
                flag(AuditRule::Bounds, row.period, row.order_id,
                     "period grant exceeds cumulative allocation");
            }
        }
    }

    void check_period_limits() {
        for (const auto& summary : run_.summaries) {
            Quantity granted = 0;
            if (auto iter = rows_.find(summary.period); iter != rows_.end()) {
                for (const auto* row : iter->second) {
                    granted = checked_add(granted, row->qty_allocated_this_period);
                }
            }
            if (granted > summary.global_limit) {
                flag(AuditRule::PeriodLimit, summary.period, {},
                     "granted " + std::to_string(granted) + " over limit " +
                         std::to_string(summary.global_limit));
            }
            if (granted != summary.total_allocated) {
                flag(AuditRule::PeriodLimit, summary.period, {},
                     "summary reports " + std::to_string(summary.total_allocated) +
                         " allocated, rows sum to " + std::to_string(granted));
            }
            if (granted != std::min(summary.global_limit, summary.total_demand)) {
                flag(AuditRule::LimitUsage, summary.period, {},
                     "granted " + std::to_string(granted) + " with limit " +
                         std::to_string(summary.global_limit) + " and demand " +
                         std::to_string(summary.total_demand));
            }
        }
    }

    void check_tier_precedence(Period period, const std::vector<const AllocationResult*>& rows) {
        TierDemand short_after{};
        TierDemand granted{};
        for (const auto* row : rows) {
            auto idx = tier_index(row->priority_tier);
            short_after[idx] = checked_add(
                short_after[idx], row->qty_ordered - std::min(row->qty_allocated, row->qty_ordered));
            granted[idx] = checked_add(granted[idx], row->qty_allocated_this_period);
        }
        for (PriorityTier higher : ALL_TIERS) {
            if (short_after[tier_index(higher)] == 0) {
                continue;
            }
            for (PriorityTier lower : ALL_TIERS) {
                if (has_precedence(higher, lower) && granted[tier_index(lower)] > 0) {
                    flag(AuditRule::TierPrecedence, period, {},
                         std::string(to_string(lower)) + " served while " +
                             std::string(to_string(higher)) + " is short");
                }
            }
            // Lower tiers were all checked against the first short tier
            break;
        }
    }

    void check_fifo_precedence(Period period, const std::vector<const AllocationResult*>& rows) {
        auto key = [](const AllocationResult* row) {
            return std::tie(row->period_requested, row->order_id);
        };
        for (const auto* older : rows) {
            if (older->qty_allocated >= older->qty_ordered) {
                continue;
            }
            for (const auto* newer : rows) {
                if (newer->priority_tier == older->priority_tier && key(older) < key(newer) &&
                    newer->qty_allocated_this_period > 0) {
                    flag(AuditRule::FifoPrecedence, period, newer->order_id,
                         "served while older order " + older->order_id + " is short");
                }
            }
        }
    }

    void check_history() {
        std::unordered_map<std::string, const AllocationResult*> last_seen;
        std::vector<Period> schedule;
        for (const auto& summary : run_.summaries) {
            schedule.push_back(summary.period);
        }

        for (std::size_t idx = 0; idx < schedule.size(); ++idx) {
            auto iter = rows_.find(schedule[idx]);
            if (iter == rows_.end()) {
                continue;
            }
            for (const auto* row : iter->second) {
                auto prev_iter = last_seen.find(row->order_id);
                if (prev_iter != last_seen.end()) {
                    const auto* prev = prev_iter->second;
                    if (prev->period == row->period) {
                        flag(AuditRule::Conservation, row->period, row->order_id,
                             "order reported twice in one period");
                        continue;
                    }
                    if (row->qty_allocated !=
                        checked_add(prev->qty_allocated, row->qty_allocated_this_period)) {
                        flag(AuditRule::Monotonicity, row->period, row->order_id,
                             "cumulative allocation does not extend the previous period");
                    }
                    if (row->qty_ordered != prev->qty_ordered ||
                        row->period_requested != prev->period_requested ||
                        row->priority_tier != prev->priority_tier) {
                        flag(AuditRule::Monotonicity, row->period, row->order_id,
                             "order identity changed between periods");
                    }
                    if (idx == 0 || prev->period != schedule[idx - 1]) {
                        flag(AuditRule::Carry, row->period, row->order_id,
                             "order skipped a period while open");
                    }
                    if (prev->qty_allocated >= prev->qty_ordered) {
                        flag(AuditRule::Carry, row->period, row->order_id,
                             "Full order carried into another period");
                    }
                }
                last_seen[row->order_id] = row;
            }
        }

        // Orders still short after their last row must still be open
        Period last_period = schedule.empty() ? 0 : schedule.back();
        for (const auto& [order_id, row] : last_seen) {
            if (row->qty_allocated < row->qty_ordered && row->period != last_period) {
                flag(AuditRule::Carry, row->period, order_id, "unmet order dropped from backlog");
            }
        }

        for (const auto& order : run_.orders) {
            auto iter = last_seen.find(order.order_id());
            if (iter == last_seen.end()) {
                continue;
            }
            const auto* row = iter->second;
            if (order.qty_allocated() != row->qty_allocated ||
                order.qty_ordered() != row->qty_ordered) {
                flag(AuditRule::Conservation, row->period, order.order_id(),
                     "final order state disagrees with its last reported row");
            }
            if (checked_add(order.qty_allocated(), order.qty_remaining()) != order.qty_ordered()) {
                flag(AuditRule::Conservation, row->period, order.order_id(),
                     "allocated plus remaining differs from ordered");
            }
        }
    }

    const AllocationRun& run_;
    RowsByPeriod rows_;
    std::vector<InvariantViolation> violations_;
};

} // anonymous namespace

std::string_view to_string(AuditRule rule) noexcept {
    switch (rule) {
        case AuditRule::Bounds:         return "bounds";
        case AuditRule::PeriodLimit:    return "period_limit";
        case AuditRule::LimitUsage:     return "limit_usage";
        case AuditRule::TierPrecedence: return "tier_precedence";
        case AuditRule::FifoPrecedence: return "fifo_precedence";
        case AuditRule::Monotonicity:   return "monotonicity";
        case AuditRule::Carry:          return "carry";
        case AuditRule::Conservation:   return "conservation";
    }
    return "unknown";
}

std::vector<InvariantViolation> audit_run(const AllocationRun& run) {
    return Auditor(run).audit();
}

} // namespace allocsim::algo
