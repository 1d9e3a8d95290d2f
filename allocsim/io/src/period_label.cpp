#include <allocsim/io/period_label.hpp>

#include <charconv>
#include <cstdio>

namespace allocsim::io {

namespace {

constexpr core::Period WEEKS_PER_KEY_YEAR = 100;
constexpr core::Period MIN_ISO_YEAR = 1000;
constexpr core::Period MAX_ISO_YEAR = 9999;

std::optional<int64_t> parse_int(std::string_view text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

// Weekday of December 31st of `year`, 0 = Sunday (Gregorian calendar).
int64_t dec31_weekday(int64_t year) {
    return (year + year / 4 - year / 100 + year / 400) % 7;
}

} // anonymous namespace

int64_t iso_weeks_in_year(int64_t year) {
    // Long years end on a Thursday, or on a Friday after a leap day
    bool long_year = dec31_weekday(year) == 4 || dec31_weekday(year - 1) == 3;
    return long_year ? 53 : 52;
}

std::optional<core::Period> parse_period(std::string_view text) {
    if (auto pos = text.find("-W"); pos != std::string_view::npos && pos > 0) {
        auto year = parse_int(text.substr(0, pos));
        auto week = parse_int(text.substr(pos + 2));
        if (!year || !week || *year < MIN_ISO_YEAR || *year > MAX_ISO_YEAR ||
            *week < 1 || *week > iso_weeks_in_year(*year)) {
            return std::nullopt;
        }
        return *year * WEEKS_PER_KEY_YEAR + *week;
    }
    return parse_int(text);
}

std::string format_period(core::Period period) {
    core::Period year = period / WEEKS_PER_KEY_YEAR;
    core::Period week = period % WEEKS_PER_KEY_YEAR;
    if (year < MIN_ISO_YEAR || year > MAX_ISO_YEAR || week < 1 || week > iso_weeks_in_year(year)) {
        return std::to_string(period);
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%lld-W%02lld",
                  static_cast<long long>(year), static_cast<long long>(week));
    return buffer;
}

} // namespace allocsim::io
