#include "shapefile.hpp"

#include <fmt/format.h>
#include <gdal.h>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gridseries::gdal {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* ds) const noexcept { GDALClose(ds); }
};
using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

auto to_ring(const OGRLinearRing& ring) -> Ring {
    Ring out;
    out.reserve(static_cast<std::size_t>(ring.getNumPoints()));
    for (int i = 0; i < ring.getNumPoints(); ++i) {
        out.push_back(Point{.x = ring.getX(i), .y = ring.getY(i)});
    }
    return out;
}

auto to_polygon(const OGRPolygon& poly) -> Polygon {
    Polygon out;
    if (const auto* exterior = poly.getExteriorRing()) {
        out.outer = to_ring(*exterior);
    }
    for (int i = 0; i < poly.getNumInteriorRings(); ++i) {
        out.holes.push_back(to_ring(*poly.getInteriorRing(i)));
    }
    return out;
}

auto to_geography(const std::string& id, const OGRGeometry& geom) -> Result<Geography> {
    switch (wkbFlatten(geom.getGeometryType())) {
        case wkbPoint: {
            const auto* point = geom.toPoint();
            return Geography::point(id, Point{.x = point->getX(), .y = point->getY()});
        }
        case wkbPolygon:
            return Geography::polygon(id, {to_polygon(*geom.toPolygon())});
        case wkbMultiPolygon: {
            std::vector<Polygon> parts;
            for (const auto* poly : *geom.toMultiPolygon()) {
                parts.push_back(to_polygon(*poly));
            }
            return Geography::polygon(id, std::move(parts));
        }
        default:
            return invalid_parameter(fmt::format("geography '{}': unsupported geometry type {}",
                                                 id, geom.getGeometryName()));
    }
}

}  // namespace

auto OgrGeographySource::load(const io::GeographyQuery& query) const -> Result<GeographySet> {
    static std::once_flag registered;
    std::call_once(registered, [] { GDALAllRegister(); });

    const auto path = query.path.string();
    DatasetPtr dataset(GDALDataset::Open(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
    if (!dataset) {
        return source_read_failure(fmt::format("{}: cannot open vector dataset", path));
    }
    if (dataset->GetLayerCount() < 1) {
        return source_read_failure(fmt::format("{}: dataset has no layers", path));
    }
    OGRLayer* layer = dataset->GetLayer(0);
    const int id_index = layer->GetLayerDefn()->GetFieldIndex(query.id_field.c_str());
    if (id_index < 0) {
        return source_read_failure(
            fmt::format("{}: no attribute field '{}'", path, query.id_field));
    }

    GeographySet out;
    std::size_t skipped = 0;
    std::size_t mismatched = 0;
    layer->ResetReading();
    for (auto& feature : *layer) {
        std::string id = feature->GetFieldAsString(id_index);
        const OGRGeometry* geom = feature->GetGeometryRef();
        if (geom == nullptr || geom->IsEmpty()) {
            ++skipped;
            continue;
        }
        auto geography = to_geography(id, *geom);
        if (!geography) {
            return source_read_failure(
                fmt::format("{}: {}", path, geography.error().message));
        }
        if (geography->kind() != query.kind) {
            ++mismatched;
        }
        if (auto added = out.add(std::move(*geography)); !added) {
            return source_read_failure(fmt::format("{}: {}", path, added.error().message));
        }
    }

    if (skipped > 0) {
        spdlog::warn("{}: skipped {} features without geometry", path, skipped);
    }
    if (mismatched > 0) {
        spdlog::warn("{}: {} features are not {} geometries", path, mismatched,
                     query.kind == ShapeKind::Point ? "point" : "polygon");
    }
    spdlog::debug("{}: loaded {} geographies keyed by {}", path, out.size(), query.id_field);
    return out;
}

}  // namespace gridseries::gdal
