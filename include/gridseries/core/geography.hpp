#pragma once

#include <gridseries/core/error.hpp>
#include <gridseries/core/grid.hpp>

#include <cstdint>
#include <robin_hood.h>
#include <string>
#include <string_view>
#include <vector>

namespace gridseries {

struct Point {
    double x = 0.0;
    double y = 0.0;
    auto operator==(const Point&) const -> bool = default;
};

/// Closed vertex sequence (first == last).
using Ring = std::vector<Point>;

/// One polygon part: an outer boundary plus optional holes.
struct Polygon {
    Ring outer;
    std::vector<Ring> holes;
};

enum class ShapeKind : std::uint8_t {
    Polygon,
    Point,
};

/// A geography (ZIP code, county, monitoring site, ...) expressed in the
/// coordinate space of the grid it is aggregated against.
class Geography {
   public:
    /// Rings that are not closed are closed here. Every ring needs at least
    /// three distinct vertices.
    [[nodiscard]] static auto polygon(std::string id, std::vector<Polygon> parts)
        -> Result<Geography>;

    [[nodiscard]] static auto point(std::string id, Point location) -> Geography;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto kind() const noexcept -> ShapeKind { return kind_; }
    [[nodiscard]] auto parts() const noexcept -> const std::vector<Polygon>& { return parts_; }

    /// The point itself for point geographies.
    [[nodiscard]] auto location() const noexcept -> Point { return location_; }

    /// Extra identifying columns (e.g. site metadata from a point file).
    [[nodiscard]] auto metadata() const noexcept -> const std::vector<std::string>& {
        return metadata_;
    }
    void set_metadata(std::vector<std::string> metadata) { metadata_ = std::move(metadata); }

    [[nodiscard]] auto bounds() const noexcept -> Box;

    /// Unsigned area, holes subtracted. Zero for points.
    [[nodiscard]] auto area() const noexcept -> double;

    /// Area centroid for polygons, falling back to the vertex average when
    /// the polygon has no area; the location for points.
    [[nodiscard]] auto representative_point() const noexcept -> Point;

   private:
    Geography() = default;

    std::string id_;
    ShapeKind kind_ = ShapeKind::Point;
    std::vector<Polygon> parts_;
    Point location_;
    std::vector<std::string> metadata_;
};

/// Signed shoelace area of a closed ring (positive when counter-clockwise
/// in a y-up frame).
[[nodiscard]] auto signed_area(const Ring& ring) noexcept -> double;

/// Ordered collection of geographies with unique ids.
class GeographySet {
   public:
    GeographySet() = default;

    /// Append, rejecting duplicate ids.
    [[nodiscard]] auto add(Geography geography) -> Result<void>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return items_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return items_.empty(); }
    [[nodiscard]] auto operator[](std::size_t idx) const noexcept -> const Geography& {
        return items_[idx];
    }

    [[nodiscard]] auto find(std::string_view id) const -> const Geography*;

    [[nodiscard]] auto begin() const noexcept { return items_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return items_.cend(); }

   private:
    std::vector<Geography> items_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
};

}  // namespace gridseries
