#pragma once

/// @file period_label.hpp
/// @brief Conversion between period keys and their textual labels.
/// @ingroup io_loaders

#include <allocsim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace allocsim::io {

/// @brief Number of ISO weeks (52 or 53) in ISO year @p year.
/// @ingroup io_loaders
[[nodiscard]] int64_t iso_weeks_in_year(int64_t year);

/// @brief Parse a period label.
///
/// Accepts a plain integer ("12", "-3") or an ISO week label ("2026-W03"),
/// which maps to the ordered key YYYYWW (202603). The week must exist in
/// that ISO year, so "2026-W53" parses and "2025-W53" does not.
///
/// @param text Label to parse.
/// @return The period key, or std::nullopt if @p text is not a period.
/// @ingroup io_loaders
[[nodiscard]] std::optional<core::Period> parse_period(std::string_view text);

/// @brief ISO week label of a YYYYWW key ("2026-W03").
///
/// Keys are not tagged with their origin: every key whose YYYY part lies in
/// [1000, 9999] and whose WW part is a week of that ISO year belongs to the
/// week key space and prints as a label, even if it was given as a plain
/// integer (150010 prints as "1500-W10"). Plain period indices should stay
/// below 100000. Either way parse_period() maps the output back to
/// @p period, so reports stay lossless.
///
/// @param period Period key.
/// @return The label, or the plain number if @p period is not a YYYYWW key.
/// @ingroup io_loaders
[[nodiscard]] std::string format_period(core::Period period);

} // namespace allocsim::io
