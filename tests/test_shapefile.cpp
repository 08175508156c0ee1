#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <shapefile.hpp>

using gridseries::ShapeKind;
using gridseries::gdal::OgrGeographySource;
using gridseries::io::GeographyQuery;

namespace {

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

struct Feature {
    const char* id;
    const char* wkt;
};

void write_shapefile(const std::filesystem::path& path, OGRwkbGeometryType type,
                     std::initializer_list<Feature> features) {
    GDALAllRegister();
    auto* driver = GetGDALDriverManager()->GetDriverByName("ESRI Shapefile");
    REQUIRE(driver != nullptr);
    std::filesystem::remove_all(path.parent_path());
    std::filesystem::create_directories(path.parent_path());

    GDALDataset* ds = driver->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    REQUIRE(ds != nullptr);
    OGRLayer* layer = ds->CreateLayer("zips", nullptr, type, nullptr);
    REQUIRE(layer != nullptr);
    OGRFieldDefn field("ZIP", OFTString);
    field.SetWidth(5);
    REQUIRE(layer->CreateField(&field) == OGRERR_NONE);

    for (const auto& f : features) {
        OGRFeature feature(layer->GetLayerDefn());
        feature.SetField("ZIP", f.id);
        OGRGeometry* geom = nullptr;
        REQUIRE(OGRGeometryFactory::createFromWkt(f.wkt, nullptr, &geom) == OGRERR_NONE);
        feature.SetGeometryDirectly(geom);
        REQUIRE(layer->CreateFeature(&feature) == OGRERR_NONE);
    }
    GDALClose(ds);
}

}  // namespace

TEST_CASE("Read polygon shapefiles", "[gdal][shapes]") {
    auto path = tmp("gridseries_test_shp") / "zips.shp";
    write_shapefile(path, wkbPolygon,
                    {{"02138", "POLYGON ((0 0, 2 0, 2 2, 0 2, 0 0), (0.5 0.5, 1 0.5, 1 1, 0.5 1, 0.5 0.5))"},
                     {"02139", "MULTIPOLYGON (((3 0, 4 0, 4 1, 3 1, 3 0)), ((5 0, 6 0, 6 1, 5 1, 5 0)))"}});

    OgrGeographySource source;
    auto geos = source.load(GeographyQuery{.path = path, .id_field = "ZIP", .kind = ShapeKind::Polygon});
    REQUIRE(geos.has_value());
    REQUIRE(geos->size() == 2);

    const auto& a = (*geos)[0];
    REQUIRE(a.id() == "02138");
    REQUIRE(a.parts().size() == 1);
    REQUIRE(a.parts()[0].holes.size() == 1);
    REQUIRE(a.area() == Catch::Approx(3.75));

    const auto* b = geos->find("02139");
    REQUIRE(b != nullptr);
    REQUIRE(b->parts().size() == 2);
    REQUIRE(b->area() == Catch::Approx(2.0));

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("Read point shapefiles", "[gdal][shapes]") {
    auto path = tmp("gridseries_test_shp_points") / "sites.shp";
    write_shapefile(path, wkbPoint, {{"00001", "POINT (-71.5 42.25)"}});

    auto geos = OgrGeographySource{}.load(
        GeographyQuery{.path = path, .id_field = "ZIP", .kind = ShapeKind::Point});
    REQUIRE(geos.has_value());
    REQUIRE(geos->size() == 1);
    REQUIRE((*geos)[0].kind() == ShapeKind::Point);
    REQUIRE((*geos)[0].location().x == Catch::Approx(-71.5));
    REQUIRE((*geos)[0].location().y == Catch::Approx(42.25));

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("Shapefile errors", "[gdal][shapes]") {
    auto path = tmp("gridseries_test_shp_errors") / "zips.shp";
    write_shapefile(path, wkbPolygon, {{"02138", "POLYGON ((0 0, 1 0, 1 1, 0 0))"}});
    OgrGeographySource source;

    SECTION("unknown id field") {
        auto geos = source.load(GeographyQuery{.path = path, .id_field = "GEOID"});
        REQUIRE_FALSE(geos.has_value());
        REQUIRE(geos.error().kind == gridseries::ErrorKind::SourceReadFailure);
    }

    SECTION("missing file") {
        auto geos = source.load(GeographyQuery{.path = path.parent_path() / "none.shp", .id_field = "ZIP"});
        REQUIRE_FALSE(geos.has_value());
        REQUIRE(geos.error().kind == gridseries::ErrorKind::SourceReadFailure);
    }

    std::filesystem::remove_all(path.parent_path());
}
