#pragma once

#include <gridseries/core/error.hpp>
#include <gridseries/core/geography.hpp>
#include <gridseries/core/grid.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace gridseries::io {

/// Loads one variable's raster time series for one year, fully materialized.
class GridSource {
   public:
    virtual ~GridSource() = default;

    [[nodiscard]] virtual auto load(const std::filesystem::path& path,
                                    std::string_view variable) const -> Result<GridCube> = 0;
};

/// What to read from a geography source.
struct GeographyQuery {
    std::filesystem::path path;
    /// Attribute holding the geography id (e.g. ZIP, GEOID).
    std::string id_field;
    ShapeKind kind = ShapeKind::Polygon;
};

/// Loads an ordered GeographySet already aligned with the grid's CRS.
class GeographySource {
   public:
    virtual ~GeographySource() = default;

    [[nodiscard]] virtual auto load(const GeographyQuery& query) const -> Result<GeographySet> = 0;
};

}  // namespace gridseries::io
