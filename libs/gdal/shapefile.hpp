#pragma once
// gridseries GDAL library: reads ZIP/county polygons and point sites from any
// OGR vector dataset (ESRI shapefile in practice).
//
// Geometries are taken as stored; the dataset must already be in the grid's
// coordinate reference system (gridMET: WGS84 lon/lat).

#include <gridseries/io/sources.hpp>

namespace gridseries::gdal {

class OgrGeographySource final : public io::GeographySource {
   public:
    /// Reads the first layer. Features without geometry are skipped.
    [[nodiscard]] auto load(const io::GeographyQuery& query) const
        -> Result<GeographySet> override;
};

}  // namespace gridseries::gdal
