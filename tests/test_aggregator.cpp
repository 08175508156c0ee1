#include <gridseries/engine/aggregator.hpp>
#include <gridseries/engine/downscale.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using gridseries::Date;
using gridseries::Geography;
using gridseries::GeographySet;
using gridseries::GridCube;
using gridseries::GridGeometry;
using gridseries::Polygon;
using gridseries::Ring;
using gridseries::make_date;
using gridseries::engine::AggregateOptions;
using gridseries::ErrorKind;
using gridseries::engine::aggregate;
using gridseries::engine::downscale;
using gridseries::engine::RasterizationStrategy;
using gridseries::engine::Strategy;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

auto rect(double x0, double y0, double x1, double y1) -> Ring {
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

auto polygon(const std::string& id, Ring outer) -> Geography {
    auto geo = Geography::polygon(id, {Polygon{.outer = std::move(outer)}});
    REQUIRE(geo.has_value());
    return *geo;
}

auto set_of(std::vector<Geography> geos) -> GeographySet {
    GeographySet set;
    for (auto& g : geos) {
        REQUIRE(set.add(std::move(g)).has_value());
    }
    return set;
}

auto strategy(Strategy kind, std::int64_t factor = 2,
              Strategy refinement = Strategy::AllTouched) -> RasterizationStrategy {
    auto s = RasterizationStrategy::make(kind, factor, refinement);
    REQUIRE(s.has_value());
    return *s;
}

// 2x2 grid over [0,2]x[0,2]:
//   1 2
//   3 4
auto scenario_cube(std::vector<double> values = {1, 2, 3, 4},
                   std::vector<Date> dates = {make_date(2020, 1, 1)}) -> GridCube {
    GridGeometry g{.origin_x = 0.0,
                   .origin_y = 2.0,
                   .cell_width = 1.0,
                   .cell_height = -1.0,
                   .rows = 2,
                   .cols = 2};
    auto cube = GridCube::create(g, std::move(dates), std::move(values), std::nullopt, "tmmx");
    REQUIRE(cube.has_value());
    return *cube;
}

}  // namespace

TEST_CASE("Top-left cell polygon yields 1.0 under every strategy", "[engine][aggregate]") {
    auto cube = scenario_cube();
    auto geos = set_of({polygon("tl", rect(0, 1, 1, 2))});

    for (auto s : {strategy(Strategy::Default), strategy(Strategy::AllTouched),
                   strategy(Strategy::Combined), strategy(Strategy::Downscale, 2),
                   strategy(Strategy::Downscale, 3, Strategy::Combined)}) {
        auto result = aggregate(cube, geos, s);
        REQUIRE(result.has_value());
        REQUIRE(result->table.rows() == 1);
        auto row = result->table.row(0);
        REQUIRE(row.geography_id == "tl");
        REQUIRE(row.date == make_date(2020, 1, 1));
        REQUIRE(row.value == Catch::Approx(1.0));
    }
}

TEST_CASE("Whole-extent polygon", "[engine][aggregate]") {
    auto cube = scenario_cube();
    auto geos = set_of({polygon("all", rect(0, 0, 2, 2))});

    SECTION("combined averages by area") {
        auto result = aggregate(cube, geos, strategy(Strategy::Combined));
        REQUIRE(result.has_value());
        REQUIRE(result->table.values[0] == Catch::Approx(2.5));
    }

    SECTION("all-touched averages cells") {
        auto result = aggregate(cube, geos, strategy(Strategy::AllTouched));
        REQUIRE(result.has_value());
        REQUIRE(result->table.values[0] == Catch::Approx(2.5));
    }

    SECTION("default samples the centroid cell") {
        auto result = aggregate(cube, geos, strategy(Strategy::Default));
        REQUIRE(result.has_value());
        REQUIRE(result->table.values[0] == Catch::Approx(1.0));
    }
}

TEST_CASE("Downscaling a single cell keeps its value", "[engine][aggregate]") {
    GridGeometry g{.origin_x = 0.0,
                   .origin_y = 1.0,
                   .cell_width = 1.0,
                   .cell_height = -1.0,
                   .rows = 1,
                   .cols = 1};
    auto cube = GridCube::create(g, {make_date(2015, 6, 1)}, {5.0});
    REQUIRE(cube.has_value());
    auto geos = set_of({polygon("q", rect(0, 0.5, 0.5, 1))});

    for (auto refinement : {Strategy::AllTouched, Strategy::Combined}) {
        auto result = aggregate(*cube, geos, strategy(Strategy::Downscale, 2, refinement));
        REQUIRE(result.has_value());
        REQUIRE(result->table.rows() == 1);
        REQUIRE(result->table.values[0] == Catch::Approx(5.0));
    }
}

TEST_CASE("Geographies outside the grid produce no rows", "[engine][aggregate]") {
    auto cube = scenario_cube();
    auto geos = set_of({polygon("far", rect(10, 10, 11, 11)), polygon("tl", rect(0, 1, 1, 2))});

    auto result = aggregate(cube, geos, strategy(Strategy::Combined));
    REQUIRE(result.has_value());
    REQUIRE(result->table.rows() == 1);
    REQUIRE(result->table.geography_ids[0] == "tl");
    REQUIRE(result->report.geographies == 2);
    REQUIRE(result->report.out_of_bounds == 1);
}

TEST_CASE("No-data cells are skipped", "[engine][aggregate]") {
    auto geos = set_of({polygon("all", rect(0, 0, 2, 2))});

    SECTION("NaN cells drop out of the weighted mean") {
        auto cube = scenario_cube({kNaN, 2, 3, 4});
        auto result = aggregate(cube, geos, strategy(Strategy::Combined));
        REQUIRE(result.has_value());
        REQUIRE(result->table.values[0] == Catch::Approx(3.0));
    }

    SECTION("sentinel values count as no-data") {
        GridGeometry g = scenario_cube().geometry();
        auto cube = GridCube::create(g, {make_date(2020, 1, 1)}, {-9999, 2, 3, 4}, -9999.0);
        REQUIRE(cube.has_value());
        auto result = aggregate(*cube, geos, strategy(Strategy::AllTouched));
        REQUIRE(result.has_value());
        REQUIRE(result->table.values[0] == Catch::Approx(3.0));
    }

    SECTION("a day without any data is omitted") {
        auto cube = scenario_cube({1, 2, 3, 4, kNaN, kNaN, kNaN, kNaN, 5, 5, 5, 5},
                                  {make_date(2020, 1, 1), make_date(2020, 1, 2),
                                   make_date(2020, 1, 3)});
        auto result = aggregate(cube, geos, strategy(Strategy::Combined));
        REQUIRE(result.has_value());
        REQUIRE(result->table.rows() == 2);
        REQUIRE(result->table.dates[0] == make_date(2020, 1, 1));
        REQUIRE(result->table.dates[1] == make_date(2020, 1, 3));
        REQUIRE(result->table.values[1] == Catch::Approx(5.0));
        REQUIRE(result->report.no_coverage == 1);
        REQUIRE(result->report.rows == 2);
    }
}

TEST_CASE("Rows are ordered by geography then date", "[engine][aggregate]") {
    auto cube = scenario_cube({1, 2, 3, 4, 10, 20, 30, 40},
                              {make_date(2020, 1, 1), make_date(2020, 1, 2)});
    auto geos = set_of({polygon("br", rect(1, 0, 2, 1)), polygon("tl", rect(0, 1, 1, 2))});

    auto result = aggregate(cube, geos, strategy(Strategy::Combined));
    REQUIRE(result.has_value());
    const auto& t = result->table;
    REQUIRE(t.rows() == 4);
    REQUIRE(t.row(0) == gridseries::engine::SeriesRow{"br", make_date(2020, 1, 1), 4.0});
    REQUIRE(t.row(1) == gridseries::engine::SeriesRow{"br", make_date(2020, 1, 2), 40.0});
    REQUIRE(t.row(2) == gridseries::engine::SeriesRow{"tl", make_date(2020, 1, 1), 1.0});
    REQUIRE(t.row(3) == gridseries::engine::SeriesRow{"tl", make_date(2020, 1, 2), 10.0});
    REQUIRE(t.value_column == "tmmx");
}

TEST_CASE("Date filter restricts layers", "[engine][aggregate]") {
    auto cube = scenario_cube({1, 2, 3, 4, 10, 20, 30, 40, 100, 200, 300, 400},
                              {make_date(2020, 1, 1), make_date(2020, 1, 2),
                               make_date(2020, 1, 3)});
    auto geos = set_of({polygon("tl", rect(0, 1, 1, 2))});

    AggregateOptions options;
    options.date_filter = [](Date d) { return d == make_date(2020, 1, 2); };
    auto result = aggregate(cube, geos, strategy(Strategy::Default), options);
    REQUIRE(result.has_value());
    REQUIRE(result->report.days == 1);
    REQUIRE(result->table.rows() == 1);
    REQUIRE(result->table.values[0] == Catch::Approx(10.0));
}

TEST_CASE("Point metadata is carried to the output", "[engine][aggregate]") {
    auto cube = scenario_cube();
    auto site = Geography::point("s1", {.x = 1.5, .y = 0.5});
    site.set_metadata({"MA", "urban"});
    auto geos = set_of({site});

    AggregateOptions options;
    options.metadata_columns = {"state", "setting"};
    auto result = aggregate(cube, geos, strategy(Strategy::Default), options);
    REQUIRE(result.has_value());
    const auto& t = result->table;
    REQUIRE(t.rows() == 1);
    REQUIRE(t.values[0] == 4.0);
    REQUIRE(t.metadata_columns == std::vector<std::string>{"state", "setting"});
    REQUIRE(t.metadata.size() == 2);
    REQUIRE(t.metadata[0][0] == "MA");
    REQUIRE(t.metadata[1][0] == "urban");
}

TEST_CASE("Aggregation is deterministic across runs and thread counts", "[engine][aggregate]") {
    GridGeometry g{.origin_x = -90.0,
                   .origin_y = 45.0,
                   .cell_width = 0.1,
                   .cell_height = -0.1,
                   .rows = 30,
                   .cols = 40};
    std::vector<Date> dates;
    for (int d = 1; d <= 4; ++d) {
        dates.push_back(make_date(2012, 7, static_cast<unsigned>(d)));
    }
    std::vector<double> values(dates.size() * g.cell_count());
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = std::sin(static_cast<double>(i) * 0.37) * 10.0 + 290.0;
        if (i % 17 == 0) {
            values[i] = kNaN;
        }
    }
    auto cube = GridCube::create(g, dates, values, std::nullopt, "tmmn");
    REQUIRE(cube.has_value());

    std::vector<Geography> geos;
    for (int i = 0; i < 37; ++i) {
        double x0 = -89.95 + 0.1 * (i % 8) * 4.7;
        double y0 = 42.05 + 0.07 * (i / 8) * 5.3;
        geos.push_back(polygon(std::to_string(10000 + i),
                               {{x0, y0}, {x0 + 0.43, y0 + 0.05}, {x0 + 0.31, y0 + 0.38}}));
    }
    auto set = set_of(std::move(geos));

    for (auto kind : {Strategy::AllTouched, Strategy::Combined, Strategy::Downscale}) {
        auto s = strategy(kind, 3);
        auto single = aggregate(*cube, set, s);
        REQUIRE(single.has_value());

        auto again = aggregate(*cube, set, s);
        REQUIRE(again.has_value());
        REQUIRE(again->table.geography_ids == single->table.geography_ids);
        REQUIRE(again->table.dates == single->table.dates);
        REQUIRE(again->table.values == single->table.values);

        for (std::size_t threads : {2U, 4U, 64U, 0U}) {
            AggregateOptions options;
            options.threads = threads;
            auto parallel = aggregate(*cube, set, s, options);
            REQUIRE(parallel.has_value());
            REQUIRE(parallel->table.geography_ids == single->table.geography_ids);
            REQUIRE(parallel->table.dates == single->table.dates);
            REQUIRE(parallel->table.values == single->table.values);
            REQUIRE(parallel->report.no_coverage == single->report.no_coverage);
            REQUIRE(parallel->report.out_of_bounds == single->report.out_of_bounds);
        }
    }
}

TEST_CASE("Downscale strategy matches aggregating a downscaled cube", "[engine][aggregate]") {
    GridGeometry g{.origin_x = -100.0,
                   .origin_y = 40.0,
                   .cell_width = 0.25,
                   .cell_height = -0.25,
                   .rows = 6,
                   .cols = 7};
    std::vector<Date> dates = {make_date(2019, 2, 1), make_date(2019, 2, 2)};
    std::vector<double> values(dates.size() * g.cell_count());
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = 270.0 + static_cast<double>((i * 7) % 23);
        if (i % 11 == 3) {
            values[i] = kNaN;
        }
    }
    auto cube = GridCube::create(g, dates, values, std::nullopt, "tmmx");
    REQUIRE(cube.has_value());

    auto geos = set_of({polygon("a", {{-99.9, 38.6}, {-98.7, 38.9}, {-99.2, 39.85}}),
                        polygon("b", rect(-98.9, 38.55, -98.35, 39.1)),
                        polygon("c", {{-99.6, 39.3}, {-99.45, 39.3}, {-99.45, 39.41}})});

    for (std::int64_t factor : {2, 3, 5}) {
        auto fine = downscale(*cube, factor);
        REQUIRE(fine.has_value());
        for (auto refinement : {Strategy::AllTouched, Strategy::Combined}) {
            auto folded = aggregate(*cube, geos, strategy(Strategy::Downscale, factor, refinement));
            auto expected = aggregate(*fine, geos, strategy(refinement));
            REQUIRE(folded.has_value());
            REQUIRE(expected.has_value());
            REQUIRE(folded->table.geography_ids == expected->table.geography_ids);
            REQUIRE(folded->table.dates == expected->table.dates);
            REQUIRE(folded->table.rows() == expected->table.rows());
            for (std::size_t i = 0; i < folded->table.rows(); ++i) {
                REQUIRE(folded->table.values[i] == Catch::Approx(expected->table.values[i]));
            }
            REQUIRE(folded->report.no_coverage == expected->report.no_coverage);
        }
    }
}

TEST_CASE("A throwing date filter becomes an error", "[engine][aggregate][error]") {
    AggregateOptions options;
    options.date_filter = [](Date) -> bool { throw std::runtime_error("bad filter"); };
    auto result = aggregate(scenario_cube(), set_of({polygon("tl", rect(0, 1, 1, 2))}),
                            strategy(Strategy::Combined), options);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::SourceReadFailure);
    REQUIRE(result.error().message.find("bad filter") != std::string::npos);
}

TEST_CASE("Empty geography set", "[engine][aggregate]") {
    auto result = aggregate(scenario_cube(), GeographySet{}, strategy(Strategy::Combined));
    REQUIRE(result.has_value());
    REQUIRE(result->table.rows() == 0);
    REQUIRE(result->report.geographies == 0);
}
