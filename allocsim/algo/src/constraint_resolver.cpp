#include <allocsim/algo/constraint_resolver.hpp>

#include <algorithm>

namespace allocsim::algo {

using namespace allocsim::core;

ResolvedLimit ConstraintResolver::resolve(const SupplyRecord& supply,
                                          const std::optional<LookaheadForecast>& next,
                                          Quantity carried_in) const {
    ResolvedLimit limit;
    limit.base_limit = checked_add(supply.base_limit(), carried_in);

    if (lookahead_enabled_ && next) {
        limit.reserved = std::min(next->deficit(), limit.base_limit);
    }
    limit.global_limit = limit.base_limit - limit.reserved;

    if (limit.reserved > 0) {
        limit.constraining_input = ConstrainingInput::Lookahead;
    } else if (supply.subcomponent_a_qty <= supply.subcomponent_b_qty) {
        limit.constraining_input = ConstrainingInput::SubcomponentA;
    } else {
        limit.constraining_input = ConstrainingInput::SubcomponentB;
    }
    return limit;
}

} // namespace allocsim::algo
