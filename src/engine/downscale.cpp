#include <gridseries/engine/downscale.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace gridseries::engine {

auto downscale(const GridCube& cube, std::int64_t factor) -> Result<GridCube> {
    if (factor < 1) {
        return invalid_parameter(
            fmt::format("downscale factor must be a positive integer (got {})", factor));
    }
    if (factor == 1) {
        return cube;
    }

    const auto k = static_cast<std::size_t>(factor);
    const auto& src = cube.geometry();
    const auto dst = src.downscaled(k);

    std::vector<double> values(cube.layers() * dst.cell_count());
    auto out = values.begin();
    for (std::size_t layer = 0; layer < cube.layers(); ++layer) {
        auto slice = cube.layer(layer);
        for (std::size_t r = 0; r < src.rows; ++r) {
            // Expand one source row horizontally, then repeat it k times.
            auto row_begin = out;
            for (std::size_t c = 0; c < src.cols; ++c) {
                out = std::fill_n(out, k, slice[r * src.cols + c]);
            }
            for (std::size_t rep = 1; rep < k; ++rep) {
                out = std::copy(row_begin, row_begin + static_cast<std::ptrdiff_t>(dst.cols), out);
            }
        }
    }

    std::vector<Date> dates(cube.dates().begin(), cube.dates().end());
    return GridCube::create(dst, std::move(dates), std::move(values), cube.nodata(),
                            cube.variable());
}

}  // namespace gridseries::engine
