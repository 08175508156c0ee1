#include <gridseries/engine/aggregator.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gridseries::engine {

namespace {

auto select_layers(const GridCube& cube, const AggregateOptions& options)
    -> std::vector<std::size_t> {
    std::vector<std::size_t> layers;
    layers.reserve(cube.layers());
    auto dates = cube.dates();
    for (std::size_t i = 0; i < dates.size(); ++i) {
        if (!options.date_filter || options.date_filter(dates[i])) {
            layers.push_back(i);
        }
    }
    return layers;
}

auto make_table(const GridCube& cube, const AggregateOptions& options) -> SeriesTable {
    SeriesTable table;
    if (!cube.variable().empty()) {
        table.value_column = cube.variable();
    }
    table.metadata_columns = options.metadata_columns;
    table.metadata.resize(options.metadata_columns.size());
    return table;
}

struct Slice {
    std::size_t begin = 0;
    std::size_t end = 0;
    SeriesTable table;
    AggregateReport report;
    std::optional<std::string> failure;
};

}  // namespace

auto aggregate_geography(const GridCube& cube, const Geography& geography,
                         const CellWeightMap& weights, std::span<const std::size_t> layers,
                         SeriesTable& out) -> std::size_t {
    const auto values = cube.values();
    const std::size_t cells = cube.geometry().cell_count();
    const std::size_t cols = cube.geometry().cols;
    const bool with_metadata = !out.metadata_columns.empty();
    std::vector<std::string> extra;
    if (with_metadata) {
        extra = geography.metadata();
        extra.resize(out.metadata_columns.size());
    }

    std::size_t missing = 0;
    for (auto layer : layers) {
        const std::size_t base = layer * cells;
        double sum = 0.0;
        double weight_sum = 0.0;
        for (const auto& cw : weights) {
            double v = values[base + cw.row * cols + cw.col];
            if (cube.is_nodata(v)) {
                continue;
            }
            sum += cw.weight * v;
            weight_sum += cw.weight;
        }
        if (weight_sum <= 0.0) {
            ++missing;
            continue;
        }
        SeriesRow row{.geography_id = geography.id(),
                      .date = cube.dates()[layer],
                      .value = sum / weight_sum};
        if (with_metadata) {
            out.append(std::move(row), extra);
        } else {
            out.append(std::move(row));
        }
    }
    return missing;
}

auto aggregate(const GridCube& cube, const GeographySet& geographies,
               const RasterizationStrategy& strategy, const AggregateOptions& options)
    -> Result<AggregateResult> {
    // Downscaling is applied to the weights, not the values: maps are computed
    // on the finer geometry and folded back onto source cells, so the cube is
    // never materialized at factor^2 size.
    const std::size_t factor = strategy.factor();
    const GridGeometry geometry =
        factor > 1 ? cube.geometry().downscaled(factor) : cube.geometry();

    std::vector<std::size_t> layers;
    try {
        layers = select_layers(cube, options);
    } catch (const std::exception& e) {
        return source_read_failure(fmt::format("date filter failed: {}", e.what()));
    }
    const CellWeighter weighter(geometry, strategy.weighting());

    spdlog::info("aggregating {} geographies x {} days (strategy={}, factor={}, grid={}x{})",
                 geographies.size(), layers.size(), to_string(strategy.kind()), factor,
                 geometry.rows, geometry.cols);

    const std::size_t n = geographies.size();
    std::size_t threads = options.threads;
    if (threads == 0) {
        threads = std::max<unsigned>(1, std::thread::hardware_concurrency());
    }
    threads = std::max<std::size_t>(1, std::min(threads, n));
    const std::size_t chunk = n == 0 ? 0 : (n + threads - 1) / threads;

    std::vector<Slice> slices;
    slices.reserve(threads);
    for (std::size_t start = 0; start < n; start += chunk) {
        Slice slice;
        slice.begin = start;
        slice.end = std::min(n, start + chunk);
        slice.table = make_table(cube, options);
        slices.push_back(std::move(slice));
    }

    auto work = [&](Slice& slice) {
        try {
            for (std::size_t i = slice.begin; i < slice.end; ++i) {
                const auto& geography = geographies[i];
                auto weights = fold_weights(weighter.weights(geography), factor);
                ++slice.report.geographies;
                if (weights.empty()) {
                    ++slice.report.out_of_bounds;
                    spdlog::debug("geography {} lies outside the grid; no data", geography.id());
                    continue;
                }
                slice.report.no_coverage +=
                    aggregate_geography(cube, geography, weights, layers, slice.table);
            }
        } catch (const std::exception& e) {
            slice.failure = e.what();
        }
    };

    if (slices.size() > 1) {
        std::vector<std::thread> workers;
        workers.reserve(slices.size());
        for (auto& slice : slices) {
            workers.emplace_back([&work, &slice] { work(slice); });
        }
        for (auto& th : workers) {
            th.join();
        }
    } else {
        for (auto& slice : slices) {
            work(slice);
        }
    }

    AggregateResult result;
    result.table = make_table(cube, options);
    result.report.days = layers.size();
    for (auto& slice : slices) {
        if (slice.failure) {
            return source_read_failure(fmt::format("aggregating geographies {}..{} failed: {}",
                                                   slice.begin, slice.end, *slice.failure));
        }
        result.table.append(std::move(slice.table));
        result.report.geographies += slice.report.geographies;
        result.report.out_of_bounds += slice.report.out_of_bounds;
        result.report.no_coverage += slice.report.no_coverage;
    }
    result.report.rows = result.table.rows();

    spdlog::info("aggregated {} rows ({} geographies outside grid, {} geography-days without data)",
                 result.report.rows, result.report.out_of_bounds, result.report.no_coverage);
    return result;
}

}  // namespace gridseries::engine
