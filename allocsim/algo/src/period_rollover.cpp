#include <allocsim/algo/period_rollover.hpp>

#include <utility>

namespace allocsim::algo {

using namespace allocsim::core;

RolloverResult PeriodRollover::roll_over(Backlog backlog) const {
    RolloverResult result;
    for (auto& order : backlog.release()) {
        if (order.is_full()) {
            result.closed.push_back(std::move(order));
        } else {
            result.carried.add(std::move(order));
        }
    }
    return result;
}

} // namespace allocsim::algo
