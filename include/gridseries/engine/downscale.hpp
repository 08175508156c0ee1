#pragma once

#include <gridseries/core/error.hpp>
#include <gridseries/core/grid.hpp>

#include <cstdint>

namespace gridseries::engine {

/// Nearest-neighbour supersampling: every source cell becomes a
/// factor x factor block of identical values. The factor applies to both
/// axes; dates, nodata sentinel and variable name are preserved.
/// factor == 1 returns a copy of the input, factor < 1 is rejected.
[[nodiscard]] auto downscale(const GridCube& cube, std::int64_t factor) -> Result<GridCube>;

}  // namespace gridseries::engine
