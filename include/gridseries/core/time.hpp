#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gridseries {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Broken-down civil date.
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
};

/// Build a Date from a proleptic Gregorian year/month/day.
[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> Date;

[[nodiscard]] auto to_civil(Date date) -> CivilDate;

/// Format as YYYY-MM-DD.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// Parse YYYY-MM-DD. Returns nullopt on malformed or impossible dates.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Shift a date by a (possibly fractional) number of days since `origin`.
/// Fractions are truncated toward the start of the day.
[[nodiscard]] auto days_since(Date origin, double offset) -> Date;

}  // namespace gridseries

namespace std {

template <>
struct hash<gridseries::Date> {
    auto operator()(const gridseries::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

}  // namespace std
