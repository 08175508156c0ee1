#include <gridseries/config/config.hpp>
#include <gridseries/config/date_filter.hpp>
#include <gridseries/engine/strategy.hpp>
#include <gridseries/io/series_writer.hpp>
#include <gridseries/pipeline/task.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <netcdf_grid.hpp>
#include <parquet.hpp>
#include <points.hpp>
#include <shapefile.hpp>
#include <string>
#include <vector>

namespace {

namespace config = gridseries::config;

auto fail(const gridseries::Error& error) -> int {
    fmt::print(stderr, "gridseries: {}\n", error.format());
    return 1;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"gridseries: aggregate gridMET rasters over ZIP codes, counties and points"};
    app.set_version_flag("--version", "gridseries 0.1.0");
    app.set_config("--config", "", "Read options from a TOML/INI file");

    std::vector<std::string> variables{"tmmx"};
    std::string strategy = "default";
    std::int64_t factor = gridseries::engine::RasterizationStrategy::kDefaultDownscaleFactor;
    std::string refinement = "all_touched";
    std::string geography = "zip";
    std::string shape = "polygon";
    std::vector<std::string> years{"1990:2020"};
    std::string shapes_dir = "shapes";
    std::string destination = "data/processed";
    std::string downloads = "data/downloads";
    std::string points;
    std::vector<std::string> coordinates;
    std::vector<std::string> metadata;
    std::string dates;
    std::size_t threads = 1;
    std::string format = "parquet";
    bool verbose = false;
    bool quiet = false;

    app.add_option("--var,--variables", variables, "gridMET bands, e.g. tmmx pr rmax")
        ->expected(1, -1)
        ->capture_default_str();
    app.add_option("--strategy", strategy,
                   "Rasterization strategy: default, all_touched, combined, downscale "
                   "(downscale is recommended for polygons)")
        ->capture_default_str();
    app.add_option("--factor", factor, "Downscale factor")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--refine", refinement,
                   "Strategy applied to the downscaled grid: all_touched or combined")
        ->capture_default_str();
    app.add_option("--geography", geography, "Geography type: zip or county")
        ->capture_default_str();
    app.add_option("--shapes", shape, "Shape kind: polygon or point")->capture_default_str();
    app.add_option("--years", years, "Years and ranges, e.g. 1992:1995 1998")
        ->expected(1, -1)
        ->capture_default_str();
    app.add_option("--shapes-dir", shapes_dir,
                   "Shape files root: <dir>/<year>/<geography>/<kind>/*.shp")
        ->capture_default_str();
    app.add_option("--destination", destination, "Output directory")->capture_default_str();
    app.add_option("--downloads", downloads,
                   "Directory holding <variable>_<year>.nc, or a single netCDF file")
        ->capture_default_str();
    auto* points_opt =
        app.add_option("--points", points, "CSV file with point locations instead of shapes")
            ->check(CLI::ExistingFile);
    app.add_option("--coordinates", coordinates, "X and Y column names in the points file")
        ->expected(2)
        ->needs(points_opt);
    app.add_option("--metadata", metadata,
                   "Points file columns copied to the output; the first is the id")
        ->expected(1, -1)
        ->needs(points_opt);
    app.add_option("--dates", dates,
                   "Restrict days: from:to, dayofmonth:1,15, month:1,2 or date:01-15");
    app.add_option("--threads", threads, "Worker threads (0 = all cores)")
        ->capture_default_str();
    app.add_option("--format", format,
                   "Artifact format: parquet (ZSTD-compressed) or csv (uncompressed)")
        ->capture_default_str();
    app.add_flag("-v,--verbose", verbose, "Enable debug output");
    app.add_flag("-q,--quiet", quiet, "Only report warnings and errors")->excludes("--verbose");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    config::RunConfig run;
    for (const auto& name : variables) {
        auto variable = config::parse_variable(name);
        if (!variable) {
            return fail(variable.error());
        }
        run.variables.push_back(*variable);
    }
    auto parsed_years = config::parse_years(years);
    if (!parsed_years) {
        return fail(parsed_years.error());
    }
    run.years = std::move(*parsed_years);

    auto parsed_strategy = gridseries::engine::parse_strategy(strategy);
    if (!parsed_strategy) {
        return fail(parsed_strategy.error());
    }
    run.strategy = *parsed_strategy;
    auto parsed_refinement = gridseries::engine::parse_strategy(refinement);
    if (!parsed_refinement) {
        return fail(parsed_refinement.error());
    }
    run.refinement = *parsed_refinement;
    run.factor = factor;

    auto geography_type = config::find_geography_type(geography);
    if (!geography_type) {
        return fail(geography_type.error());
    }
    run.geography = std::move(*geography_type);

    // a points file only makes sense with point geometries
    auto shape_kind = config::parse_shape_kind(points.empty() ? shape : "point");
    if (!shape_kind) {
        return fail(shape_kind.error());
    }
    run.shape = *shape_kind;

    run.shapes_dir = shapes_dir;
    run.destination = destination;
    run.downloads = downloads;
    run.points = points;
    run.coordinates = coordinates;
    run.metadata = metadata;
    run.threads = threads;

    if (!dates.empty()) {
        auto filter = config::DateFilter::parse(dates);
        if (!filter) {
            return fail(filter.error());
        }
        run.dates = std::move(*filter);
    }
    auto output_format = config::parse_output_format(format);
    if (!output_format) {
        return fail(output_format.error());
    }
    run.format = *output_format;

    if (auto valid = run.validate(); !valid) {
        return fail(valid.error());
    }

    gridseries::netcdf::NetcdfGridSource grid;
    gridseries::gdal::OgrGeographySource shapes;
    std::unique_ptr<gridseries::csv::CsvPointSource> point_source;
    if (!run.points.empty()) {
        point_source = std::make_unique<gridseries::csv::CsvPointSource>(
            run.coordinates[0], run.coordinates[1],
            std::vector<std::string>(run.metadata.begin() + 1, run.metadata.end()));
    }
    gridseries::io::CsvSeriesWriter csv_writer;
    gridseries::parquet::ParquetSeriesWriter parquet_writer;
    const gridseries::io::SeriesWriter* writer = &parquet_writer;
    if (run.format == config::OutputFormat::Csv) {
        writer = &csv_writer;
    }

    auto outcomes = gridseries::pipeline::run_all(
        run, gridseries::pipeline::Collaborators{
                 .grid = &grid, .shapes = &shapes, .points = point_source.get(), .writer = writer});
    if (!outcomes) {
        return fail(outcomes.error());
    }

    for (const auto& outcome : *outcomes) {
        const auto& r = outcome.report;
        spdlog::info("{} {}: {} rows, {} geographies ({} outside grid), {} days -> {}",
                     config::to_string(outcome.variable), outcome.year, r.rows, r.geographies,
                     r.out_of_bounds, r.days, outcome.artifact.string());
    }
    return 0;
}
