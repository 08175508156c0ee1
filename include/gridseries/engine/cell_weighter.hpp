#pragma once

#include <gridseries/core/geography.hpp>
#include <gridseries/core/grid.hpp>
#include <gridseries/engine/strategy.hpp>

#include <cstddef>
#include <vector>

namespace gridseries::engine {

struct CellWeight {
    std::size_t row = 0;
    std::size_t col = 0;
    double weight = 0.0;
    auto operator==(const CellWeight&) const -> bool = default;
};

/// Cells contributing to one geography, sorted by (row, col). Empty when the
/// geography lies outside the grid.
using CellWeightMap = std::vector<CellWeight>;

/// Maps geographies onto the cells of one grid geometry.
///
/// Polygon overlap is computed exactly by clipping every ring against the
/// cell rows and then the cell columns in grid index space, where each cell
/// is a unit square; holes subtract and multi-part polygons add. A cell
/// counts as overlapped only when the clipped area is positive, so sharing
/// an edge with the polygon does not make a cell contribute.
class CellWeighter {
   public:
    /// Strategy::Downscale weights like Strategy::AllTouched; pass
    /// RasterizationStrategy::weighting() to honour a Combined refinement.
    CellWeighter(GridGeometry geometry, Strategy strategy);

    [[nodiscard]] auto geometry() const noexcept -> const GridGeometry& { return geometry_; }
    [[nodiscard]] auto strategy() const noexcept -> Strategy { return strategy_; }

    [[nodiscard]] auto weights(const Geography& geography) const -> CellWeightMap;

   private:
    [[nodiscard]] auto single_cell(const Point& point) const -> CellWeightMap;
    [[nodiscard]] auto overlap(const Geography& geography) const -> CellWeightMap;

    GridGeometry geometry_;
    Strategy strategy_;
};

/// Maps a weight map computed on a grid downscaled by `factor` back onto the
/// source cells: fine cell (r, c) belongs to source cell (r / factor,
/// c / factor) and the weights of one block are summed. Aggregating the
/// source cube with the folded map equals aggregating the materialized
/// downscaled cube with the fine map, since every fine cell of a block
/// carries the source cell's value.
[[nodiscard]] auto fold_weights(const CellWeightMap& fine, std::size_t factor) -> CellWeightMap;

}  // namespace gridseries::engine
