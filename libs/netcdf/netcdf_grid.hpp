#pragma once
// gridseries netCDF library: reads one gridMET band/year file into a GridCube.
//
// Expected layout (as published by the Northwest Knowledge Network):
//   float/short <band>(day, lat, lon) with standard_name = "<band>"
//   double day(day)  units = "days since 1900-01-01 00:00:00"
//   double lat(lat), lon(lon)  cell centres
// Packed values are unpacked with scale_factor / add_offset; _FillValue and
// missing_value become NaN.

#include <gridseries/io/sources.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace gridseries::netcdf {

/// Parsed "<unit> since <date>" time axis units.
struct TimeUnits {
    Date origin;
    /// Multiplier converting one axis unit to days.
    double days_per_unit = 1.0;
};

/// Accepts days/hours/minutes/seconds since YYYY-MM-DD[ hh:mm:ss].
[[nodiscard]] auto parse_time_units(std::string_view units) -> std::optional<TimeUnits>;

class NetcdfGridSource final : public io::GridSource {
   public:
    [[nodiscard]] auto load(const std::filesystem::path& path, std::string_view variable) const
        -> Result<GridCube> override;
};

}  // namespace gridseries::netcdf
