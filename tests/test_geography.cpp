#include <gridseries/core/geography.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using gridseries::ErrorKind;
using gridseries::Geography;
using gridseries::GeographySet;
using gridseries::Point;
using gridseries::Polygon;
using gridseries::Ring;

namespace {

auto square(double x0, double y0, double side) -> Ring {
    return {{x0, y0}, {x0 + side, y0}, {x0 + side, y0 + side}, {x0, y0 + side}};
}

auto reversed(Ring ring) -> Ring {
    std::reverse(ring.begin(), ring.end());
    return ring;
}

}  // namespace

TEST_CASE("Geography::polygon closes rings", "[core][geography]") {
    auto geo = Geography::polygon("a", {Polygon{.outer = square(0, 0, 1)}});
    REQUIRE(geo.has_value());
    REQUIRE(geo->kind() == gridseries::ShapeKind::Polygon);

    const auto& outer = geo->parts().front().outer;
    REQUIRE(outer.size() == 5);
    REQUIRE(outer.front() == outer.back());
}

TEST_CASE("Geography::polygon rejects degenerate rings", "[core][geography]") {
    SECTION("too few vertices") {
        auto geo = Geography::polygon("a", {Polygon{.outer = {{0, 0}, {1, 0}}}});
        REQUIRE_FALSE(geo.has_value());
        REQUIRE(geo.error().kind == ErrorKind::InvalidParameter);
    }

    SECTION("no parts") {
        REQUIRE_FALSE(Geography::polygon("a", {}).has_value());
    }

    SECTION("bad hole") {
        auto geo = Geography::polygon(
            "a", {Polygon{.outer = square(0, 0, 4), .holes = {{{1, 1}, {2, 2}}}}});
        REQUIRE_FALSE(geo.has_value());
    }
}

TEST_CASE("Geography area subtracts holes whatever the winding", "[core][geography]") {
    auto ccw = Geography::polygon(
        "ccw", {Polygon{.outer = square(0, 0, 4), .holes = {square(1, 1, 2)}}});
    auto cw = Geography::polygon(
        "cw", {Polygon{.outer = reversed(square(0, 0, 4)), .holes = {reversed(square(1, 1, 2))}}});
    REQUIRE(ccw.has_value());
    REQUIRE(cw.has_value());

    REQUIRE(ccw->area() == Catch::Approx(12.0));
    REQUIRE(cw->area() == Catch::Approx(12.0));

    SECTION("multi-part polygons add") {
        auto multi = Geography::polygon(
            "m", {Polygon{.outer = square(0, 0, 1)}, Polygon{.outer = square(5, 5, 2)}});
        REQUIRE(multi.has_value());
        REQUIRE(multi->area() == Catch::Approx(5.0));
    }
}

TEST_CASE("Geography representative point", "[core][geography]") {
    SECTION("area centroid") {
        auto geo = Geography::polygon("a", {Polygon{.outer = reversed(square(0, 0, 2))}});
        REQUIRE(geo.has_value());
        auto c = geo->representative_point();
        REQUIRE(c.x == Catch::Approx(1.0));
        REQUIRE(c.y == Catch::Approx(1.0));
    }

    SECTION("centroid weighs parts by area") {
        auto geo = Geography::polygon(
            "a", {Polygon{.outer = square(0, 0, 2)}, Polygon{.outer = square(10, 0, 2)}});
        REQUIRE(geo.has_value());
        auto c = geo->representative_point();
        REQUIRE(c.x == Catch::Approx(6.0));
        REQUIRE(c.y == Catch::Approx(1.0));
    }

    SECTION("zero-area polygon falls back to the vertex average") {
        auto geo = Geography::polygon("line", {Polygon{.outer = {{0, 0}, {1, 0}, {2, 0}}}});
        REQUIRE(geo.has_value());
        REQUIRE(geo->area() == 0.0);
        auto c = geo->representative_point();
        REQUIRE(c.x == Catch::Approx(1.0));
        REQUIRE(c.y == Catch::Approx(0.0));
    }
}

TEST_CASE("Point geographies", "[core][geography]") {
    auto site = Geography::point("site-1", Point{.x = -71.1, .y = 42.3});
    site.set_metadata({"MA"});

    REQUIRE(site.kind() == gridseries::ShapeKind::Point);
    REQUIRE(site.area() == 0.0);
    REQUIRE(site.representative_point() == Point{.x = -71.1, .y = 42.3});
    REQUIRE(site.bounds().min_x == site.bounds().max_x);
    REQUIRE(site.metadata() == std::vector<std::string>{"MA"});
}

TEST_CASE("GeographySet keeps order and unique ids", "[core][geography]") {
    GeographySet set;
    REQUIRE(set.empty());
    REQUIRE(set.add(Geography::point("b", {})).has_value());
    REQUIRE(set.add(Geography::point("a", {.x = 1.0, .y = 1.0})).has_value());

    SECTION("insertion order") {
        REQUIRE(set.size() == 2);
        REQUIRE(set[0].id() == "b");
        REQUIRE(set[1].id() == "a");
    }

    SECTION("lookup by id") {
        const auto* a = set.find("a");
        REQUIRE(a != nullptr);
        REQUIRE(a->location().x == 1.0);
        REQUIRE(set.find("zz") == nullptr);
    }

    SECTION("duplicates are rejected") {
        auto again = set.add(Geography::point("a", {}));
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().kind == ErrorKind::InvalidParameter);
        REQUIRE(set.size() == 2);
    }
}
