#pragma once

#include <gridseries/core/error.hpp>
#include <gridseries/core/time.hpp>

#include <compare>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace gridseries {

/// Index of one grid cell.
struct Cell {
    std::size_t row = 0;
    std::size_t col = 0;
    auto operator<=>(const Cell&) const = default;
};

/// Axis-aligned rectangle in grid coordinate space.
struct Box {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    [[nodiscard]] auto intersects(const Box& other) const noexcept -> bool {
        return min_x < other.max_x && other.min_x < max_x && min_y < other.max_y &&
               other.min_y < max_y;
    }
};

/// Georeferencing of a north-up raster: corner origin, signed cell size and
/// dimensions. Cell (r, c) spans origin_x + c * cell_width ..
/// origin_x + (c + 1) * cell_width horizontally and origin_y + r * cell_height ..
/// origin_y + (r + 1) * cell_height vertically.
struct GridGeometry {
    double origin_x = 0.0;
    double origin_y = 0.0;
    double cell_width = 1.0;
    double cell_height = -1.0;
    std::size_t rows = 0;
    std::size_t cols = 0;

    [[nodiscard]] auto cell_count() const noexcept -> std::size_t { return rows * cols; }

    /// Absolute area of one cell.
    [[nodiscard]] auto cell_area() const noexcept -> double;

    /// Fractional column coordinate of x (0 at the origin edge).
    [[nodiscard]] auto column_coordinate(double x) const noexcept -> double {
        return (x - origin_x) / cell_width;
    }

    /// Fractional row coordinate of y (0 at the origin edge).
    [[nodiscard]] auto row_coordinate(double y) const noexcept -> double {
        return (y - origin_y) / cell_height;
    }

    /// Cell containing (x, y). Points on a shared edge resolve to the lower
    /// row/col index. Returns nullopt outside the extent.
    [[nodiscard]] auto locate(double x, double y) const noexcept -> std::optional<Cell>;

    [[nodiscard]] auto cell_bounds(std::size_t row, std::size_t col) const noexcept -> Box;

    [[nodiscard]] auto extent() const noexcept -> Box;

    /// Same extent subdivided `factor` times along both axes.
    [[nodiscard]] auto downscaled(std::size_t factor) const noexcept -> GridGeometry;

    auto operator==(const GridGeometry&) const -> bool = default;
};

/// One variable's raster time series: layers[day][row][col], row-major,
/// immutable once built.
class GridCube {
   public:
    GridCube() = default;

    /// Validates dimensions, cell size, date ordering and the value count.
    [[nodiscard]] static auto create(GridGeometry geometry, std::vector<Date> dates,
                                     std::vector<double> values,
                                     std::optional<double> nodata = std::nullopt,
                                     std::string variable = {}) -> Result<GridCube>;

    [[nodiscard]] auto geometry() const noexcept -> const GridGeometry& { return geometry_; }
    [[nodiscard]] auto dates() const noexcept -> std::span<const Date> { return dates_; }
    [[nodiscard]] auto layers() const noexcept -> std::size_t { return dates_.size(); }
    [[nodiscard]] auto nodata() const noexcept -> std::optional<double> { return nodata_; }
    [[nodiscard]] auto variable() const noexcept -> const std::string& { return variable_; }

    /// All layers, row-major.
    [[nodiscard]] auto values() const noexcept -> std::span<const double> { return values_; }

    /// One day's rows * cols slice.
    [[nodiscard]] auto layer(std::size_t index) const -> std::span<const double>;

    [[nodiscard]] auto value(std::size_t layer, std::size_t row, std::size_t col) const
        -> double {
        return values_[(layer * geometry_.rows + row) * geometry_.cols + col];
    }

    /// True for NaN and for the sentinel, when the cube has one.
    [[nodiscard]] auto is_nodata(double v) const noexcept -> bool;

    auto operator==(const GridCube&) const -> bool = default;

   private:
    GridCube(GridGeometry geometry, std::vector<Date> dates, std::vector<double> values,
             std::optional<double> nodata, std::string variable)
        : geometry_(geometry),
          dates_(std::move(dates)),
          values_(std::move(values)),
          nodata_(nodata),
          variable_(std::move(variable)) {}

    GridGeometry geometry_;
    std::vector<Date> dates_;
    std::vector<double> values_;
    std::optional<double> nodata_;
    std::string variable_;
};

}  // namespace gridseries
