#include <allocsim/core/priority_tier.hpp>

namespace allocsim::core {

std::string_view to_string(PriorityTier tier) noexcept {
    switch (tier) {
        case PriorityTier::P1: return "P1";
        case PriorityTier::P2: return "P2";
        case PriorityTier::P3: return "P3";
        case PriorityTier::P4: return "P4";
        case PriorityTier::P5: return "P5";
        case PriorityTier::P6: return "P6";
        case PriorityTier::P7: return "P7";
        case PriorityTier::P8: return "P8";
        case PriorityTier::P9: return "P9";
    }
    return "P?";
}

std::optional<PriorityTier> tier_from_rank(int64_t rank) noexcept {
    if (rank < 1 || rank > static_cast<int64_t>(TIER_COUNT)) {
        return std::nullopt;
    }
    return static_cast<PriorityTier>(rank);
}

std::optional<PriorityTier> parse_priority_tier(std::string_view text) noexcept {
    if (!text.empty() && (text.front() == 'P' || text.front() == 'p')) {
        text.remove_prefix(1);
    }
    // Single digit only: "P10" or "01" are not tiers
    if (text.size() != 1 || text.front() < '0' || text.front() > '9') {
        return std::nullopt;
    }
    return tier_from_rank(text.front() - '0');
}

} // namespace allocsim::core
