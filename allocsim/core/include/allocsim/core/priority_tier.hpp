#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace allocsim::core {

/// @brief Closed, strictly ordered set of customer priority tiers.
/// @ingroup core_types
///
/// P1 has the highest precedence and P9 the lowest. The underlying value is
/// the tier rank; ordering is defined once, by has_precedence(), and never by
/// comparing tier labels as strings.
///
/// @see has_precedence, ALL_TIERS, parse_priority_tier
enum class PriorityTier : uint8_t {
    P1 = 1,
    P2,
    P3,
    P4,
    P5,
    P6,
    P7,
    P8,
    P9
};

/// @brief Number of tiers in PriorityTier.
/// @ingroup core_types
inline constexpr std::size_t TIER_COUNT = 9;

/// @brief Every tier, highest precedence first.
/// @ingroup core_types
inline constexpr std::array<PriorityTier, TIER_COUNT> ALL_TIERS{
    PriorityTier::P1, PriorityTier::P2, PriorityTier::P3,
    PriorityTier::P4, PriorityTier::P5, PriorityTier::P6,
    PriorityTier::P7, PriorityTier::P8, PriorityTier::P9};

/// @brief Rank of a tier (1 for P1, 9 for P9).
[[nodiscard]] constexpr int tier_rank(PriorityTier tier) noexcept {
    return static_cast<int>(tier);
}

/// @brief Zero-based position of a tier in ALL_TIERS.
///
/// Used to index per-tier arrays such as TierDemand.
[[nodiscard]] constexpr std::size_t tier_index(PriorityTier tier) noexcept {
    return static_cast<std::size_t>(tier) - 1;
}

/// @brief Whether @p lhs is served strictly before @p rhs in the waterfall.
/// @param lhs First tier.
/// @param rhs Second tier.
/// @return True if @p lhs has higher priority than @p rhs.
[[nodiscard]] constexpr bool has_precedence(PriorityTier lhs, PriorityTier rhs) noexcept {
    return tier_rank(lhs) < tier_rank(rhs);
}

/// @brief Canonical label of a tier ("P1" .. "P9").
[[nodiscard]] std::string_view to_string(PriorityTier tier) noexcept;

/// @brief Parse a tier label.
///
/// Accepts the canonical label ("P1" .. "P9", case-insensitive prefix) or the
/// bare rank ("1" .. "9"). Anything else, including surrounding whitespace,
/// yields an empty optional: an unknown tier is never defaulted.
///
/// @param text Label to parse.
/// @return The tier, or std::nullopt.
[[nodiscard]] std::optional<PriorityTier> parse_priority_tier(std::string_view text) noexcept;

/// @brief Convert a numeric rank to a tier.
/// @param rank Integer rank, 1 for P1.
/// @return The tier, or std::nullopt if @p rank is outside [1, 9].
[[nodiscard]] std::optional<PriorityTier> tier_from_rank(int64_t rank) noexcept;

} // namespace allocsim::core
