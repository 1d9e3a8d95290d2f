#include <allocsim/algo/allocation_engine.hpp>

#include <allocsim/core/error.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <unordered_set>
#include <utility>

namespace allocsim::algo {

using namespace allocsim::core;

namespace {

bool result_order(const AllocationResult& lhs, const AllocationResult& rhs) {
    if (lhs.priority_tier != rhs.priority_tier) {
        return has_precedence(lhs.priority_tier, rhs.priority_tier);
    }
    if (lhs.period_requested != rhs.period_requested) {
        return lhs.period_requested < rhs.period_requested;
    }
    return lhs.order_id < rhs.order_id;
}

} // anonymous namespace

AllocationEngine::AllocationEngine(EngineOptions options)
    : options_(options)
    , resolver_(options.lookahead) {}

PeriodOutcome AllocationEngine::run_period(PeriodInputs inputs, Backlog backlog) const {
    PeriodOutcome outcome;
    PeriodState& state = outcome.state;
    state.period = inputs.supply.period;
    state.backlog = std::move(backlog);

    // 1. Admit this period's orders
    for (auto& order : inputs.new_orders) {
        if (order.period_requested() > state.period) {
            throw ValidationError("order " + order.order_id() + " requested in period " +
                                  std::to_string(order.period_requested()) +
                                  ", after period " + std::to_string(state.period));
        }
        if (order.is_full()) {
            // Restored orders that are already Full are terminal and take no supply
            if (state.backlog.contains(order.order_id())) {
                throw ValidationError("duplicate order_id " + order.order_id());
            }
            outcome.closed.push_back(std::move(order));
            continue;
        }
        state.backlog.add(std::move(order));
    }

    // 2. Resolve the Global Build Limit
    ResolvedLimit limit = resolver_.resolve(inputs.supply, inputs.next, inputs.carried_reservation);
    state.global_limit = limit.global_limit;
    state.remaining_limit = limit.global_limit;
    Quantity total_demand = state.backlog.total_demand();

    std::vector<Quantity> allocated_before;
    allocated_before.reserve(state.backlog.size());
    for (const auto& order : state.backlog.orders()) {
        allocated_before.push_back(order.qty_allocated());
    }

    // 3. Waterfall across tiers, 4. FIFO within each tier
    auto tiers = waterfall_.allocate(state.global_limit, state.backlog.demand_by_tier());
    for (const auto& tier : tiers) {
        if (tier.allocated == 0) {
            continue;
        }
        auto orders = state.backlog.tier_orders(tier.tier);
        Quantity distributed = fifo_.distribute(tier.allocated, orders, state.period);
        if (distributed != tier.allocated) {
            throw InvalidStateError("tier " + std::string(to_string(tier.tier)) + " absorbed " +
                                    std::to_string(distributed) + " of " +
                                    std::to_string(tier.allocated) + " allocated units");
        }
        state.remaining_limit = checked_sub(state.remaining_limit, distributed);
    }

    // 5. Snapshot every order in the period
    const auto& orders = state.backlog.orders();
    outcome.results.reserve(orders.size());
    for (std::size_t idx = 0; idx < orders.size(); ++idx) {
        outcome.results.push_back(
            make_result(state.period, orders[idx], orders[idx].qty_allocated() - allocated_before[idx]));
    }
    std::sort(outcome.results.begin(), outcome.results.end(), result_order);

    PeriodSummary& summary = outcome.summary;
    summary.period = state.period;
    summary.base_limit = limit.base_limit;
    summary.reserved = limit.reserved;
    summary.global_limit = limit.global_limit;
    summary.total_demand = total_demand;
    summary.total_allocated = state.global_limit - state.remaining_limit;
    summary.constraining_input = limit.constraining_input;
    summary.tiers = std::move(tiers);

    report(outcome);

    // 6. Carry unmet demand forward
    RolloverResult rolled = rollover_.roll_over(std::move(state.backlog));
    state.backlog = std::move(rolled.carried);
    std::move(rolled.closed.begin(), rolled.closed.end(), std::back_inserter(outcome.closed));
    return outcome;
}

AllocationRun AllocationEngine::run(const std::vector<SupplyRecord>& supply,
                                    const std::vector<DemandOrder>& orders,
                                    const Backlog& initial_backlog) const {
    std::map<Period, SupplyRecord> supply_by_period;
    for (const auto& record : supply) {
        if (!supply_by_period.emplace(record.period, record).second) {
            throw ValidationError("duplicate supply record for period " +
                                  std::to_string(record.period));
        }
    }

    std::unordered_set<std::string> seen_ids;
    for (const auto& order : initial_backlog.orders()) {
        seen_ids.insert(order.order_id());
    }

    std::map<Period, std::vector<DemandOrder>> orders_by_period;
    std::map<Period, Quantity> demand_by_period;
    for (const auto& order : orders) {
        if (!seen_ids.insert(order.order_id()).second) {
            throw ValidationError("duplicate order_id " + order.order_id());
        }
        orders_by_period[order.period_requested()].push_back(order);
        if (order.is_full()) {
            continue;
        }
        auto& demand = demand_by_period[order.period_requested()];
        demand = checked_add(demand, order.qty_ordered());
    }

    std::vector<Period> schedule;
    for (const auto& [period, record] : supply_by_period) {
        schedule.push_back(period);
    }
    for (const auto& [period, period_orders] : orders_by_period) {
        schedule.push_back(period);
    }
    std::sort(schedule.begin(), schedule.end());
    schedule.erase(std::unique(schedule.begin(), schedule.end()), schedule.end());

    auto supply_for = [&supply_by_period](Period period) {
        auto iter = supply_by_period.find(period);
        return iter == supply_by_period.end() ? SupplyRecord{period, 0, 0} : iter->second;
    };

    AllocationRun run;
    Backlog backlog = initial_backlog;
    Quantity reserved = 0;

    for (std::size_t idx = 0; idx < schedule.size(); ++idx) {
        Period period = schedule[idx];

        PeriodInputs inputs;
        inputs.supply = supply_for(period);
        if (idx + 1 < schedule.size()) {
            Period next_period = schedule[idx + 1];
            auto demand_iter = demand_by_period.find(next_period);
            inputs.next = LookaheadForecast{
                demand_iter == demand_by_period.end() ? 0 : demand_iter->second,
                supply_for(next_period).base_limit()};
        }
        if (auto iter = orders_by_period.find(period); iter != orders_by_period.end()) {
            inputs.new_orders = std::move(iter->second);
        }
        inputs.carried_reservation = options_.carry_reservation ? reserved : 0;

        PeriodOutcome outcome = run_period(std::move(inputs), std::move(backlog));

        reserved = outcome.summary.reserved;
        backlog = std::move(outcome.state.backlog);
        run.summaries.push_back(std::move(outcome.summary));
        std::move(outcome.results.begin(), outcome.results.end(), std::back_inserter(run.results));
        std::move(outcome.closed.begin(), outcome.closed.end(), std::back_inserter(run.orders));
    }

    run.orders.insert(run.orders.end(), backlog.orders().begin(), backlog.orders().end());
    std::sort(run.orders.begin(), run.orders.end(),
              [](const DemandOrder& lhs, const DemandOrder& rhs) {
                  return lhs.order_id() < rhs.order_id();
              });
    run.backlog = std::move(backlog);
    return run;
}

void AllocationEngine::report(const PeriodOutcome& outcome) const {
    if (sink_ == nullptr) {
        return;
    }
    sink_->begin_period(outcome.summary.period);
    for (const auto& result : outcome.results) {
        sink_->write_result(result);
    }
    sink_->write_summary(outcome.summary);
    sink_->end_period();
}

} // namespace allocsim::algo
