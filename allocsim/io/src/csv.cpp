#include <allocsim/io/csv.hpp>
#include <allocsim/io/error.hpp>

#include <charconv>
#include <utility>

namespace allocsim::io {

std::vector<std::string> split_csv_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t idx = 0; idx < line.size(); ++idx) {
        char c = line[idx];
        if (in_quotes) {
            if (c == '"') {
                if (idx + 1 < line.size() && line[idx + 1] == '"') {
                    current += '"';
                    ++idx;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(field);
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

core::Quantity parse_quantity(std::string_view text, std::string_view field,
                              const std::string& context) {
    core::Quantity value = 0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        throw LoaderError("field '" + std::string(field) +
                              "' must be a non-negative integer, got '" + std::string(text) + "'",
                          context);
    }
    return value;
}

CsvTable::CsvTable(std::istream& input, std::string context)
    : context_(std::move(context)) {
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (line.empty() || line == "\r") {
            continue;
        }
        auto fields = split_csv_line(line);
        if (header_.empty()) {
            header_ = std::move(fields);
            continue;
        }
        if (fields.size() != header_.size()) {
            throw LoaderError("expected " + std::to_string(header_.size()) + " fields, got " +
                                  std::to_string(fields.size()),
                              context_ + ":" + std::to_string(line_number));
        }
        rows_.push_back(std::move(fields));
        line_numbers_.push_back(line_number);
    }

    if (header_.empty()) {
        throw LoaderError("missing CSV header", context_);
    }
}

bool CsvTable::has_column(std::string_view name) const {
    for (const auto& col : header_) {
        if (col == name) {
            return true;
        }
    }
    return false;
}

std::size_t CsvTable::column(std::string_view name) const {
    for (std::size_t idx = 0; idx < header_.size(); ++idx) {
        if (header_[idx] == name) {
            return idx;
        }
    }
    throw LoaderError("missing column '" + std::string(name) + "'", context_);
}

std::string CsvTable::row_context(std::size_t idx) const {
    return context_ + ":" + std::to_string(line_numbers_.at(idx));
}

} // namespace allocsim::io
