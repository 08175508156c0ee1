#pragma once

#include <gridseries/config/date_filter.hpp>
#include <gridseries/core/error.hpp>
#include <gridseries/core/geography.hpp>
#include <gridseries/engine/strategy.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gridseries::config {

/// gridMET bands.
enum class Variable : std::uint8_t {
    bi,      ///< Burning index: NFDRS fire danger index
    erc,     ///< Energy release component: NFDRS fire danger index
    etr,     ///< Daily reference evapotranspiration: alfalfa, mm
    fm100,   ///< 100-hour dead fuel moisture: %
    fm1000,  ///< 1000-hour dead fuel moisture: %
    pet,     ///< Potential evapotranspiration
    pr,      ///< Precipitation amount: mm, daily total
    rmax,    ///< Maximum relative humidity: %
    rmin,    ///< Minimum relative humidity: %
    sph,     ///< Specific humidity: kg/kg
    srad,    ///< Surface downward shortwave radiation: W/m^2
    th,      ///< Wind direction: degrees clockwise from north
    tmmn,    ///< Minimum temperature: K
    tmmx,    ///< Maximum temperature: K
    vpd,     ///< Mean vapor pressure deficit: kPa
    vs,      ///< Wind velocity at 10 m: m/s
};

[[nodiscard]] auto all_variables() -> std::span<const Variable>;
[[nodiscard]] auto to_string(Variable variable) -> std::string_view;
[[nodiscard]] auto parse_variable(std::string_view name) -> Result<Variable>;

/// Data-driven description of a geography type: where its id lives in the
/// shape files and what the id column is called in the output.
struct GeographyType {
    std::string name;
    std::string id_field;
    std::string id_column;
};

/// Built-in geography types: zip, county.
[[nodiscard]] auto geography_types() -> std::span<const GeographyType>;
[[nodiscard]] auto find_geography_type(std::string_view name) -> Result<GeographyType>;

[[nodiscard]] auto to_string(ShapeKind kind) -> std::string_view;
[[nodiscard]] auto parse_shape_kind(std::string_view name) -> Result<ShapeKind>;

enum class OutputFormat : std::uint8_t {
    Parquet,
    Csv,
};

[[nodiscard]] auto to_string(OutputFormat format) -> std::string_view;
[[nodiscard]] auto parse_output_format(std::string_view name) -> Result<OutputFormat>;

/// Expand year tokens such as {"1992:1995", "1998"} into a list of years,
/// keeping first-seen order and dropping repeats. Years must lie within
/// 1979..2100.
[[nodiscard]] auto parse_years(const std::vector<std::string>& tokens) -> Result<std::vector<int>>;

/// Everything one invocation needs. All paths are explicit; nothing depends
/// on the process working directory.
struct RunConfig {
    std::vector<Variable> variables;
    std::vector<int> years;
    engine::Strategy strategy = engine::Strategy::Default;
    std::int64_t factor = engine::RasterizationStrategy::kDefaultDownscaleFactor;
    engine::Strategy refinement = engine::Strategy::AllTouched;
    GeographyType geography;
    ShapeKind shape = ShapeKind::Polygon;

    std::filesystem::path shapes_dir = "shapes";
    std::filesystem::path destination = "data/processed";
    /// Directory holding ${variable}_${year}.nc, or a single grid file.
    std::filesystem::path downloads = "data/downloads";

    /// Point geographies from CSV instead of shape files.
    std::filesystem::path points;
    std::vector<std::string> coordinates;
    std::vector<std::string> metadata;

    std::optional<DateFilter> dates;
    std::size_t threads = 1;
    OutputFormat format = OutputFormat::Parquet;

    /// Builds the validated strategy (fails on a bad factor/refinement).
    [[nodiscard]] auto rasterization() const -> Result<engine::RasterizationStrategy>;

    /// Checks cross-field consistency before any work starts.
    [[nodiscard]] auto validate() const -> Result<void>;
};

/// ${variable}_${geography}_${shape}_${year}.${extension}
[[nodiscard]] auto artifact_name(const RunConfig& config, Variable variable, int year,
                                 std::string_view extension) -> std::string;

/// Grid file for a variable/year: `downloads` itself when it is a file,
/// otherwise downloads/${variable}_${year}.nc.
[[nodiscard]] auto grid_file(const RunConfig& config, Variable variable, int year)
    -> std::filesystem::path;

/// Find the shape file for the year closest to `year`: the requested year,
/// then earlier years, then later ones, within 1981..2020. Shape files live
/// in ${shapes_dir}/${year}/${geography}/${point|polygon}/*.shp.
[[nodiscard]] auto find_shape_file(const std::filesystem::path& shapes_dir, int year,
                                   std::string_view geography, ShapeKind kind)
    -> Result<std::filesystem::path>;

}  // namespace gridseries::config
