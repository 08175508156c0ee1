#include <gridseries/config/date_filter.hpp>

#include <catch2/catch_test_macros.hpp>

using gridseries::make_date;
using gridseries::config::DateFilter;

TEST_CASE("Date range filter", "[config][dates]") {
    auto filter = DateFilter::parse("2001-03-01:2001-03-31");
    REQUIRE(filter.has_value());
    REQUIRE(filter->kind() == DateFilter::Kind::Range);
    REQUIRE(filter->accept(make_date(2001, 3, 1)));
    REQUIRE(filter->accept(make_date(2001, 3, 31)));
    REQUIRE_FALSE(filter->accept(make_date(2001, 2, 28)));
    REQUIRE_FALSE(filter->accept(make_date(2001, 4, 1)));

    SECTION("open bounds") {
        auto from = DateFilter::parse("2001-03-01:");
        REQUIRE(from.has_value());
        REQUIRE(from->accept(make_date(2019, 1, 1)));
        REQUIRE_FALSE(from->accept(make_date(2001, 2, 1)));

        auto until = DateFilter::parse(":2001-03-01");
        REQUIRE(until.has_value());
        REQUIRE(until->accept(make_date(1990, 1, 1)));
        REQUIRE_FALSE(until->accept(make_date(2001, 3, 2)));
    }
}

TEST_CASE("Day-of-month, month and month-day filters", "[config][dates]") {
    SECTION("dayofmonth") {
        auto f = DateFilter::parse("dayofmonth:1,15");
        REQUIRE(f.has_value());
        REQUIRE(f->kind() == DateFilter::Kind::DayOfMonth);
        REQUIRE(f->accept(make_date(2005, 8, 15)));
        REQUIRE(f->accept(make_date(2005, 9, 1)));
        REQUIRE_FALSE(f->accept(make_date(2005, 9, 2)));
    }

    SECTION("month") {
        auto f = DateFilter::parse("month: 1, 2, 12");
        REQUIRE(f.has_value());
        REQUIRE(f->accept(make_date(2005, 12, 24)));
        REQUIRE_FALSE(f->accept(make_date(2005, 6, 1)));
    }

    SECTION("date") {
        auto f = DateFilter::parse("date:01-15,7-4");
        REQUIRE(f.has_value());
        REQUIRE(f->kind() == DateFilter::Kind::MonthDay);
        REQUIRE(f->accept(make_date(1999, 1, 15)));
        REQUIRE(f->accept(make_date(2020, 7, 4)));
        REQUIRE_FALSE(f->accept(make_date(2020, 4, 7)));
    }

    SECTION("names are case-insensitive") {
        REQUIRE(DateFilter::parse("Month:3").has_value());
    }
}

TEST_CASE("Malformed date filters", "[config][dates]") {
    for (const char* spec : {"2001-03-01", "month:13", "dayofmonth:0", "month:x",
                             "date:02", "date:13-01", "2001-02-30:2001-03-01", "yesterday:"}) {
        auto f = DateFilter::parse(spec);
        REQUIRE_FALSE(f.has_value());
        REQUIRE(f.error().kind == gridseries::ErrorKind::InvalidParameter);
    }
}
