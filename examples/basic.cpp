#include <gridseries/core/geography.hpp>
#include <gridseries/core/grid.hpp>
#include <gridseries/engine/aggregator.hpp>
#include <gridseries/engine/cell_weighter.hpp>
#include <gridseries/engine/strategy.hpp>

#include <fmt/core.h>

auto main() -> int {
    using namespace gridseries;

    // A 2x2 grid over [0,2]x[0,2], north-up, one day:
    //   1 2
    //   3 4
    GridGeometry geometry{
        .origin_x = 0.0, .origin_y = 2.0, .cell_width = 1.0, .cell_height = -1.0, .rows = 2, .cols = 2};
    auto cube = GridCube::create(geometry, {make_date(2020, 1, 1)}, {1.0, 2.0, 3.0, 4.0},
                                 std::nullopt, "tmmx");
    if (!cube) {
        fmt::print("error: {}\n", cube.error().format());
        return 1;
    }

    fmt::print("=== Geographies ===\n");
    GeographySet geos;
    auto whole = Geography::polygon(
        "whole", {Polygon{.outer = {{0.0, 0.0}, {2.0, 0.0}, {2.0, 2.0}, {0.0, 2.0}}}});
    auto corner = Geography::polygon(
        "corner", {Polygon{.outer = {{0.0, 1.0}, {1.0, 1.0}, {1.0, 2.0}, {0.0, 2.0}}}});
    if (!whole || !corner) {
        fmt::print("error: bad polygon\n");
        return 1;
    }
    for (auto* geo : {&*whole, &*corner}) {
        fmt::print("{}: area {}, centroid ({}, {})\n", geo->id(), geo->area(),
                   geo->representative_point().x, geo->representative_point().y);
        if (auto added = geos.add(*geo); !added) {
            fmt::print("error: {}\n", added.error().format());
            return 1;
        }
    }

    fmt::print("\n=== Cell weights (combined) ===\n");
    engine::CellWeighter weighter(geometry, engine::Strategy::Combined);
    for (const auto& cw : weighter.weights(*whole)) {
        fmt::print("cell ({}, {}): {}\n", cw.row, cw.col, cw.weight);
    }

    fmt::print("\n=== Aggregation ===\n");
    for (auto kind : {engine::Strategy::Default, engine::Strategy::AllTouched,
                      engine::Strategy::Combined, engine::Strategy::Downscale}) {
        auto strategy = engine::RasterizationStrategy::make(kind, 2, engine::Strategy::Combined);
        if (!strategy) {
            fmt::print("error: {}\n", strategy.error().format());
            return 1;
        }
        auto result = engine::aggregate(*cube, geos, *strategy);
        if (!result) {
            fmt::print("error: {}\n", result.error().format());
            return 1;
        }
        for (std::size_t i = 0; i < result->table.rows(); ++i) {
            auto row = result->table.row(i);
            fmt::print("{:<12} {:<7} {} {}\n", engine::to_string(kind), row.geography_id,
                       format_date(row.date), row.value);
        }
    }
    return 0;
}
