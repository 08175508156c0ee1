#include <gridseries/core/grid.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gridseries {

namespace {

// Map a fractional coordinate to an index in [0, n), sending exact interior
// edges to the lower index. Returns false outside [0, n].
auto index_of(double f, std::size_t n, std::size_t& out) noexcept -> bool {
    if (!std::isfinite(f) || f < 0.0 || f > static_cast<double>(n)) {
        return false;
    }
    double whole = std::floor(f);
    auto index = static_cast<std::size_t>(whole);
    if (whole == f && index > 0) {
        --index;
    }
    out = std::min(index, n - 1);
    return true;
}

}  // namespace

auto GridGeometry::cell_area() const noexcept -> double {
    return std::abs(cell_width * cell_height);
}

auto GridGeometry::locate(double x, double y) const noexcept -> std::optional<Cell> {
    if (rows == 0 || cols == 0) {
        return std::nullopt;
    }
    Cell cell;
    if (!index_of(row_coordinate(y), rows, cell.row) ||
        !index_of(column_coordinate(x), cols, cell.col)) {
        return std::nullopt;
    }
    return cell;
}

auto GridGeometry::cell_bounds(std::size_t row, std::size_t col) const noexcept -> Box {
    double x0 = origin_x + static_cast<double>(col) * cell_width;
    double x1 = origin_x + static_cast<double>(col + 1) * cell_width;
    double y0 = origin_y + static_cast<double>(row) * cell_height;
    double y1 = origin_y + static_cast<double>(row + 1) * cell_height;
    return Box{.min_x = std::min(x0, x1),
               .min_y = std::min(y0, y1),
               .max_x = std::max(x0, x1),
               .max_y = std::max(y0, y1)};
}

auto GridGeometry::extent() const noexcept -> Box {
    double x1 = origin_x + static_cast<double>(cols) * cell_width;
    double y1 = origin_y + static_cast<double>(rows) * cell_height;
    return Box{.min_x = std::min(origin_x, x1),
               .min_y = std::min(origin_y, y1),
               .max_x = std::max(origin_x, x1),
               .max_y = std::max(origin_y, y1)};
}

auto GridGeometry::downscaled(std::size_t factor) const noexcept -> GridGeometry {
    GridGeometry out = *this;
    if (factor <= 1) {
        return out;
    }
    auto f = static_cast<double>(factor);
    out.cell_width = cell_width / f;
    out.cell_height = cell_height / f;
    out.rows = rows * factor;
    out.cols = cols * factor;
    return out;
}

auto GridCube::create(GridGeometry geometry, std::vector<Date> dates, std::vector<double> values,
                      std::optional<double> nodata, std::string variable) -> Result<GridCube> {
    if (geometry.rows == 0 || geometry.cols == 0) {
        return invalid_parameter(
            fmt::format("grid must have positive dimensions (got {}x{})", geometry.rows,
                        geometry.cols));
    }
    if (!std::isfinite(geometry.cell_width) || !std::isfinite(geometry.cell_height) ||
        geometry.cell_width == 0.0 || geometry.cell_height == 0.0) {
        return invalid_parameter(fmt::format("grid cell size must be finite and non-zero (got {}x{})",
                                             geometry.cell_width, geometry.cell_height));
    }
    for (std::size_t i = 1; i < dates.size(); ++i) {
        if (!(dates[i - 1] < dates[i])) {
            return invalid_parameter(fmt::format("layer dates must be strictly increasing ({} after {})",
                                                 format_date(dates[i]), format_date(dates[i - 1])));
        }
    }
    const std::size_t expected = dates.size() * geometry.cell_count();
    if (values.size() != expected) {
        return invalid_parameter(fmt::format("grid holds {} values, expected {} ({} layers of {}x{})",
                                             values.size(), expected, dates.size(),
                                             geometry.rows, geometry.cols));
    }
    return GridCube{geometry, std::move(dates), std::move(values), nodata, std::move(variable)};
}

auto GridCube::layer(std::size_t index) const -> std::span<const double> {
    if (index >= layers()) {
        throw std::out_of_range(fmt::format("layer {} out of range ({} layers)", index, layers()));
    }
    const std::size_t n = geometry_.cell_count();
    return std::span<const double>(values_).subspan(index * n, n);
}

auto GridCube::is_nodata(double v) const noexcept -> bool {
    return std::isnan(v) || (nodata_.has_value() && v == *nodata_);
}

}  // namespace gridseries
