#pragma once

/// @file csv.hpp
/// @brief Minimal CSV reading helpers shared by the snapshot loaders.
/// @ingroup io_loaders

#include <allocsim/core/types.hpp>

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace allocsim::io {

/// @brief A CSV table: header plus rows of raw cells.
/// @ingroup io_loaders
class CsvTable {
public:
    /// @brief Read a whole table from @p input.
    ///
    /// The first non-empty line is the header. Fields may be double-quoted;
    /// quoted fields may contain commas and doubled quotes. Blank lines are
    /// skipped.
    ///
    /// @param input   Stream to read.
    /// @param context Name used in error messages (file name).
    /// @throws LoaderError if the header is missing or a row has the wrong
    ///         number of fields.
    CsvTable(std::istream& input, std::string context);

    /// @brief Index of a header column.
    /// @throws LoaderError if the column is absent.
    [[nodiscard]] std::size_t column(std::string_view name) const;

    /// @brief Whether the header contains @p name.
    [[nodiscard]] bool has_column(std::string_view name) const;

    /// @brief Data rows, header excluded.
    [[nodiscard]] const std::vector<std::vector<std::string>>& rows() const noexcept { return rows_; }

    /// @brief Context string of row @p idx ("file:line").
    [[nodiscard]] std::string row_context(std::size_t idx) const;

private:
    std::string context_;
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<std::size_t> line_numbers_;
};

/// @brief Split one CSV line into fields.
/// @ingroup io_loaders
[[nodiscard]] std::vector<std::string> split_csv_line(std::string_view line);

/// @brief Quote a field for CSV output if it needs it.
/// @ingroup io_loaders
[[nodiscard]] std::string csv_escape(std::string_view field);

/// @brief Parse a non-negative integer quantity.
/// @param text    Cell contents.
/// @param field   Field name for the error message.
/// @param context Row context for the error message.
/// @return The quantity.
/// @throws LoaderError if @p text is negative, fractional or not a number.
/// @ingroup io_loaders
[[nodiscard]] core::Quantity parse_quantity(std::string_view text, std::string_view field,
                                            const std::string& context);

} // namespace allocsim::io
