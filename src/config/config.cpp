#include <gridseries/config/config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <system_error>

namespace gridseries::config {

namespace {

constexpr std::array kVariables = {
    Variable::bi,   Variable::erc,  Variable::etr,  Variable::fm100, Variable::fm1000, Variable::pet,
    Variable::pr,   Variable::rmax, Variable::rmin, Variable::sph,   Variable::srad,   Variable::th,
    Variable::tmmn, Variable::tmmx, Variable::vpd,  Variable::vs,
};

// Earliest and latest years for which shape files are searched.
constexpr int kFirstShapeYear = 1981;
constexpr int kLastShapeYear = 2020;

// gridMET starts in 1979; the upper bound only guards against runaway ranges.
constexpr int kFirstGridYear = 1979;
constexpr int kLastGridYear = 2100;

auto grid_year(int y) -> bool {
    return y >= kFirstGridYear && y <= kLastGridYear;
}

auto builtin_geographies() -> const std::vector<GeographyType>& {
    static const std::vector<GeographyType> types = {
        {.name = "zip", .id_field = "ZIP", .id_column = "zip"},
        {.name = "county", .id_field = "GEOID", .id_column = "county"},
    };
    return types;
}

auto parse_int(std::string_view text, int& out) -> bool {
    if (text.empty()) {
        return false;
    }
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto shape_file_in(const std::filesystem::path& dir) -> std::optional<std::filesystem::path> {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::nullopt;
    }
    std::vector<std::filesystem::path> found;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".shp") {
            found.push_back(entry.path());
        }
    }
    if (found.empty()) {
        return std::nullopt;
    }
    std::ranges::sort(found);
    return found.front();
}

}  // namespace

auto all_variables() -> std::span<const Variable> {
    return kVariables;
}

auto to_string(Variable variable) -> std::string_view {
    switch (variable) {
        case Variable::bi:
            return "bi";
        case Variable::erc:
            return "erc";
        case Variable::etr:
            return "etr";
        case Variable::fm100:
            return "fm100";
        case Variable::fm1000:
            return "fm1000";
        case Variable::pet:
            return "pet";
        case Variable::pr:
            return "pr";
        case Variable::rmax:
            return "rmax";
        case Variable::rmin:
            return "rmin";
        case Variable::sph:
            return "sph";
        case Variable::srad:
            return "srad";
        case Variable::th:
            return "th";
        case Variable::tmmn:
            return "tmmn";
        case Variable::tmmx:
            return "tmmx";
        case Variable::vpd:
            return "vpd";
        case Variable::vs:
            return "vs";
    }
    return "unknown";
}

auto parse_variable(std::string_view name) -> Result<Variable> {
    for (auto v : kVariables) {
        if (to_string(v) == name) {
            return v;
        }
    }
    return invalid_parameter(fmt::format("unknown gridMET variable '{}'", name));
}

auto geography_types() -> std::span<const GeographyType> {
    return builtin_geographies();
}

auto find_geography_type(std::string_view name) -> Result<GeographyType> {
    for (const auto& type : builtin_geographies()) {
        if (type.name == name) {
            return type;
        }
    }
    return invalid_parameter(fmt::format("unknown geography type '{}'", name));
}

auto to_string(ShapeKind kind) -> std::string_view {
    return kind == ShapeKind::Point ? "point" : "polygon";
}

auto parse_shape_kind(std::string_view name) -> Result<ShapeKind> {
    if (name == "polygon") {
        return ShapeKind::Polygon;
    }
    if (name == "point") {
        return ShapeKind::Point;
    }
    return invalid_parameter(fmt::format("unknown shape type '{}' (expected point or polygon)", name));
}

auto to_string(OutputFormat format) -> std::string_view {
    return format == OutputFormat::Csv ? "csv" : "parquet";
}

auto parse_output_format(std::string_view name) -> Result<OutputFormat> {
    if (name == "parquet") {
        return OutputFormat::Parquet;
    }
    if (name == "csv") {
        return OutputFormat::Csv;
    }
    return invalid_parameter(fmt::format("unknown output format '{}' (expected parquet or csv)", name));
}

auto parse_years(const std::vector<std::string>& tokens) -> Result<std::vector<int>> {
    std::vector<int> years;
    auto push = [&years](int y) {
        if (std::ranges::find(years, y) == years.end()) {
            years.push_back(y);
        }
    };
    for (const auto& token : tokens) {
        std::string_view text = token;
        auto colon = text.find(':');
        if (colon == std::string_view::npos) {
            int y = 0;
            if (!parse_int(text, y)) {
                return invalid_parameter(fmt::format("'{}' is not a year", token));
            }
            if (!grid_year(y)) {
                return invalid_parameter(fmt::format("year {} outside {}..{}", y, kFirstGridYear,
                                                     kLastGridYear));
            }
            push(y);
            continue;
        }
        int first = 0;
        int last = 0;
        if (!parse_int(text.substr(0, colon), first) || !parse_int(text.substr(colon + 1), last) ||
            first > last) {
            return invalid_parameter(fmt::format("'{}' is not a year range (first:last)", token));
        }
        if (!grid_year(first) || !grid_year(last)) {
            return invalid_parameter(fmt::format("year range {} outside {}..{}", token,
                                                 kFirstGridYear, kLastGridYear));
        }
        for (int y = first; y <= last; ++y) {
            push(y);
        }
    }
    if (years.empty()) {
        return invalid_parameter("no years given");
    }
    return years;
}

auto RunConfig::rasterization() const -> Result<engine::RasterizationStrategy> {
    return engine::RasterizationStrategy::make(strategy, factor, refinement);
}

auto RunConfig::validate() const -> Result<void> {
    if (variables.empty()) {
        return invalid_parameter("no variables given");
    }
    if (years.empty()) {
        return invalid_parameter("no years given");
    }
    if (geography.name.empty()) {
        return invalid_parameter("geography type not set");
    }
    if (auto s = rasterization(); !s) {
        return std::unexpected(s.error());
    }
    if (!points.empty()) {
        if (shape != ShapeKind::Point) {
            return invalid_parameter("a points file requires point shapes");
        }
        if (coordinates.size() != 2) {
            return invalid_parameter(fmt::format(
                "a points file needs exactly two coordinate columns (got {})", coordinates.size()));
        }
        if (metadata.empty()) {
            return invalid_parameter("a points file needs at least one metadata (id) column");
        }
    }
    return {};
}

auto artifact_name(const RunConfig& config, Variable variable, int year,
                   std::string_view extension) -> std::string {
    return fmt::format("{}_{}_{}_{}.{}", to_string(variable), config.geography.name,
                       to_string(config.shape), year, extension);
}

auto grid_file(const RunConfig& config, Variable variable, int year) -> std::filesystem::path {
    std::error_code ec;
    if (std::filesystem::is_regular_file(config.downloads, ec)) {
        return config.downloads;
    }
    return config.downloads / fmt::format("{}_{}.nc", to_string(variable), year);
}

auto find_shape_file(const std::filesystem::path& shapes_dir, int year,
                     std::string_view geography, ShapeKind kind)
    -> Result<std::filesystem::path> {
    auto candidate = [&](int y) {
        return shape_file_in(shapes_dir / std::to_string(y) / std::string(geography) /
                             std::string(to_string(kind)));
    };
    for (int step : {-1, 1}) {
        for (int y = year; y >= kFirstShapeYear && y <= kLastShapeYear; y += step) {
            if (auto found = candidate(y)) {
                return *found;
            }
        }
    }
    return source_read_failure(fmt::format("no {} {} shape file for {} or any nearby year under {}",
                                           geography, to_string(kind), year, shapes_dir.string()));
}

}  // namespace gridseries::config
