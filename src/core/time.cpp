#include <gridseries/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cmath>

namespace gridseries {

namespace {

auto parse_uint(std::string_view text, unsigned& out) -> bool {
    if (text.empty()) {
        return false;
    }
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return result.ec == std::errc() && result.ptr == end;
}

}  // namespace

auto make_date(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    sys_days sd{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
    return Date{static_cast<std::int32_t>(sd.time_since_epoch().count())};
}

auto to_civil(Date date) -> CivilDate {
    using namespace std::chrono;
    year_month_day ymd{sys_days{days{date.days}}};
    return CivilDate{.year = static_cast<int>(ymd.year()),
                     .month = static_cast<unsigned>(ymd.month()),
                     .day = static_cast<unsigned>(ymd.day())};
}

auto format_date(Date date) -> std::string {
    auto civil = to_civil(date);
    return fmt::format("{:04}-{:02}-{:02}", civil.year, civil.month, civil.day);
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    unsigned y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (!parse_uint(text.substr(0, 4), y) || !parse_uint(text.substr(5, 2), m) ||
        !parse_uint(text.substr(8, 2), d)) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(y)},
                                    std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return make_date(static_cast<int>(y), m, d);
}

auto days_since(Date origin, double offset) -> Date {
    return Date{origin.days + static_cast<std::int32_t>(std::floor(offset))};
}

}  // namespace gridseries
