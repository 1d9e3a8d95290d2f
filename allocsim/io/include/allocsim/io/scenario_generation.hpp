#pragma once

/// @file scenario_generation.hpp
/// @brief Mock supply and demand generation for allocation experiments.
///
/// Produces daily subcomponent deliveries and customer order lines over a
/// run of ISO weeks, in the layout of the upstream CSV exports, and
/// convenience wrappers that turn them into ScenarioData ready for the
/// engine.
///
/// @ingroup io_generation

#include <allocsim/io/csv_snapshot.hpp>
#include <allocsim/io/customer_master.hpp>
#include <allocsim/io/scenario_loader.hpp>

#include <allocsim/core/types.hpp>

#include <chrono>
#include <cstddef>
#include <random>
#include <string>

namespace allocsim::io {

/// @brief Parameters of the mock data generator.
///
/// @ingroup io_generation
/// @see generate_snapshot
struct GenerationParams {
    std::size_t weeks{30};               ///< Number of ISO weeks to cover.
    core::Period first_week{202601};     ///< YYYYWW key of the first week.
    CustomerMaster master{default_customer_master()};  ///< Customers to draw orders from.
    double daily_probability{0.9};       ///< Chance of each daily delivery or order.
};

/// @name Quantity ranges, half-open [min, max)
/// @ingroup io_generation
/// @{
inline constexpr core::Quantity SUBCOMPONENT_A_MIN = 10;
inline constexpr core::Quantity SUBCOMPONENT_A_MAX = 50;
inline constexpr core::Quantity SUBCOMPONENT_B_MIN = 10;
inline constexpr core::Quantity SUBCOMPONENT_B_MAX = 60;
inline constexpr core::Quantity ORDER_MIN = 10;
inline constexpr core::Quantity ORDER_MAX = 90;
/// @}

/// @brief Monday of ISO week @p week_key (YYYYWW).
/// @throws ValidationError if the key is not an existing ISO week.
/// @ingroup io_generation
[[nodiscard]] std::chrono::sys_days iso_week_monday(core::Period week_key);

/// @brief YYYYWW key of the ISO week containing @p day.
/// @ingroup io_generation
[[nodiscard]] core::Period iso_week_key(std::chrono::sys_days day);

/// @brief `YYYY-MM-DD` rendering of @p day.
/// @ingroup io_generation
[[nodiscard]] std::string format_date(std::chrono::sys_days day);

/// @brief Generate raw daily exports.
///
/// For each day of the covered weeks, independently with probability
/// @c daily_probability: a Subcomponent_1 delivery of U[10,50) units, a
/// Subcomponent_2 delivery of U[10,60) units, and one Advanced_Chip order
/// line of U[10,90) units for a uniformly chosen customer. Order ids are
/// `ORD-` followed by six unique upper-case hex digits.
///
/// @param params  Generator parameters.
/// @param rng     Mersenne Twister PRNG; the same seed yields the same output.
/// @return The generated exports.
///
/// @throws ValidationError if @c first_week is not an ISO week, the master
///         is empty, or the probability lies outside [0, 1].
[[nodiscard]] Snapshot generate_snapshot(const GenerationParams& params, std::mt19937& rng);

/// @brief Generate a validated scenario (weekly supply, classified orders).
///
/// Equivalent to @ref build_scenario applied to @ref generate_snapshot.
///
/// @see generate_snapshot
[[nodiscard]] ScenarioData generate_scenario(const GenerationParams& params, std::mt19937& rng);

} // namespace allocsim::io
