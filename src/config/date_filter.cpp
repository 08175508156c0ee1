#include <gridseries/config/date_filter.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace gridseries::config {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

auto parse_number(std::string_view text, unsigned& out) -> bool {
    text = trim(text);
    if (text.empty()) {
        return false;
    }
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto split(std::string_view text, char sep) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (true) {
        auto next = text.find(sep, pos);
        if (next == std::string_view::npos) {
            parts.push_back(text.substr(pos));
            break;
        }
        parts.push_back(text.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

}  // namespace

auto DateFilter::parse(std::string_view text) -> Result<DateFilter> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return invalid_parameter(fmt::format("date filter '{}' must include ':'", text));
    }
    auto head = to_lower(trim(text.substr(0, colon)));
    auto tail = text.substr(colon + 1);

    DateFilter filter;
    if (head == "dayofmonth" || head == "month" || head == "date") {
        filter.kind_ = head == "dayofmonth" ? Kind::DayOfMonth
                       : head == "month"    ? Kind::Month
                                            : Kind::MonthDay;
        for (auto token : split(tail, ',')) {
            unsigned value = 0;
            if (filter.kind_ == Kind::MonthDay) {
                auto md = split(trim(token), '-');
                unsigned month = 0;
                unsigned day = 0;
                if (md.size() != 2 || !parse_number(md[0], month) || !parse_number(md[1], day) ||
                    month < 1 || month > 12 || day < 1 || day > 31) {
                    return invalid_parameter(
                        fmt::format("date filter: '{}' is not a MM-DD value", trim(token)));
                }
                value = (month << 8U) | day;
            } else if (!parse_number(token, value) || value < 1 ||
                       value > (filter.kind_ == Kind::Month ? 12U : 31U)) {
                return invalid_parameter(
                    fmt::format("date filter: '{}' is not a valid {}", trim(token), head));
            }
            filter.values_.push_back(value);
        }
        return filter;
    }

    filter.kind_ = Kind::Range;
    auto lo = trim(text.substr(0, colon));
    auto hi = trim(tail);
    if (!lo.empty()) {
        filter.min_ = parse_date(lo);
        if (!filter.min_) {
            return invalid_parameter(fmt::format("date filter: bad start date '{}'", lo));
        }
    }
    if (!hi.empty()) {
        filter.max_ = parse_date(hi);
        if (!filter.max_) {
            return invalid_parameter(fmt::format("date filter: bad end date '{}'", hi));
        }
    }
    return filter;
}

auto DateFilter::accept(Date date) const -> bool {
    auto civil = to_civil(date);
    auto contains = [this](unsigned v) { return std::ranges::find(values_, v) != values_.end(); };
    switch (kind_) {
        case Kind::DayOfMonth:
            return contains(civil.day);
        case Kind::Month:
            return contains(civil.month);
        case Kind::MonthDay:
            return contains((civil.month << 8U) | civil.day);
        case Kind::Range:
            break;
    }
    if (min_ && date < *min_) {
        return false;
    }
    if (max_ && date > *max_) {
        return false;
    }
    return true;
}

}  // namespace gridseries::config
