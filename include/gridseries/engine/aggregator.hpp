#pragma once

#include <gridseries/core/error.hpp>
#include <gridseries/core/geography.hpp>
#include <gridseries/core/grid.hpp>
#include <gridseries/engine/cell_weighter.hpp>
#include <gridseries/engine/series.hpp>
#include <gridseries/engine/strategy.hpp>

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace gridseries::engine {

struct AggregateOptions {
    /// Worker threads; 0 uses the hardware concurrency.
    std::size_t threads = 1;
    /// Restricts the processed layers; empty accepts every day.
    std::function<bool(Date)> date_filter;
    /// Metadata column names copied from each geography into the output.
    std::vector<std::string> metadata_columns;
};

/// Non-fatal outcomes of a run.
struct AggregateReport {
    std::size_t geographies = 0;
    std::size_t days = 0;
    std::size_t rows = 0;
    /// Geographies whose weight map was empty (entirely outside the grid).
    std::size_t out_of_bounds = 0;
    /// (geography, day) pairs where every contributing cell was no-data.
    std::size_t no_coverage = 0;
};

struct AggregateResult {
    SeriesTable table;
    AggregateReport report;
};

/// Reduce one geography's weighted cells for every selected layer, appending
/// one row per layer with data. Returns the number of layers without data.
auto aggregate_geography(const GridCube& cube, const Geography& geography,
                         const CellWeightMap& weights, std::span<const std::size_t> layers,
                         SeriesTable& out) -> std::size_t;

/// Aggregate `cube` over every geography. When the strategy downscales, weight
/// maps are computed on the finer geometry and folded onto the source cells,
/// which matches aggregating the downscaled cube without building it; maps
/// are computed once per geography and reused for all days. Geographies are split into contiguous slices across
/// worker threads and the slices are concatenated in order, so the output is
/// identical for any thread count. A failing date filter or worker yields
/// SourceReadFailure.
[[nodiscard]] auto aggregate(const GridCube& cube, const GeographySet& geographies,
                             const RasterizationStrategy& strategy,
                             const AggregateOptions& options = {}) -> Result<AggregateResult>;

}  // namespace gridseries::engine
