#include "netcdf_grid.hpp"

#include <fmt/format.h>
#include <netcdf.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <vector>

namespace gridseries::netcdf {

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

/// Owns an open netCDF id.
class NcFile {
   public:
    explicit NcFile(int id) : id_(id) {}
    NcFile(const NcFile&) = delete;
    auto operator=(const NcFile&) -> NcFile& = delete;
    ~NcFile() { nc_close(id_); }

    [[nodiscard]] auto id() const noexcept -> int { return id_; }

   private:
    int id_;
};

auto nc_failure(const std::filesystem::path& path, std::string_view what, int status)
    -> std::unexpected<Error> {
    return source_read_failure(
        fmt::format("{}: {} ({})", path.string(), what, nc_strerror(status)));
}

auto att_text(int ncid, int varid, const char* name) -> std::optional<std::string> {
    std::size_t len = 0;
    if (nc_inq_attlen(ncid, varid, name, &len) != NC_NOERR) {
        return std::nullopt;
    }
    std::string out(len, '\0');
    if (len > 0 && nc_get_att_text(ncid, varid, name, out.data()) != NC_NOERR) {
        return std::nullopt;
    }
    while (!out.empty() && out.back() == '\0') {
        out.pop_back();
    }
    return out;
}

auto att_double(int ncid, int varid, const char* name) -> std::optional<double> {
    double value = 0.0;
    if (nc_get_att_double(ncid, varid, name, &value) != NC_NOERR) {
        return std::nullopt;
    }
    return value;
}

auto var_name(int ncid, int varid) -> std::string {
    char name[NC_MAX_NAME + 1] = {};
    if (nc_inq_varname(ncid, varid, name) != NC_NOERR) {
        return {};
    }
    return name;
}

/// The 3-D variable whose standard_name is the band; failing that, one named
/// after it, then one whose name, standard_name or long_name mentions it.
auto find_band(int ncid, std::string_view band) -> std::optional<int> {
    int nvars = 0;
    if (nc_inq_nvars(ncid, &nvars) != NC_NOERR) {
        return std::nullopt;
    }
    std::optional<int> by_name;
    std::optional<int> by_substring;
    auto mentions = [band](const std::optional<std::string>& text) {
        return text && text->find(band) != std::string::npos;
    };
    for (int varid = 0; varid < nvars; ++varid) {
        int ndims = 0;
        if (nc_inq_varndims(ncid, varid, &ndims) != NC_NOERR || ndims != 3) {
            continue;
        }
        auto standard = att_text(ncid, varid, "standard_name");
        if (standard && *standard == band) {
            return varid;
        }
        auto name = var_name(ncid, varid);
        if (!by_name && name == band) {
            by_name = varid;
        }
        if (!by_substring && (name.find(band) != std::string::npos || mentions(standard) ||
                              mentions(att_text(ncid, varid, "long_name")))) {
            by_substring = varid;
        }
    }
    return by_name ? by_name : by_substring;
}

auto read_coordinate(int ncid, int dimid, std::vector<double>& out) -> int {
    char name[NC_MAX_NAME + 1] = {};
    std::size_t len = 0;
    if (int rc = nc_inq_dim(ncid, dimid, name, &len); rc != NC_NOERR) {
        return rc;
    }
    int varid = 0;
    if (int rc = nc_inq_varid(ncid, name, &varid); rc != NC_NOERR) {
        return rc;
    }
    out.resize(len);
    return nc_get_var_double(ncid, varid, out.data());
}

}  // namespace

auto parse_time_units(std::string_view units) -> std::optional<TimeUnits> {
    auto lower = to_lower(trim(units));
    auto since = lower.find(" since ");
    if (since == std::string::npos) {
        return std::nullopt;
    }
    auto unit = trim(std::string_view(lower).substr(0, since));
    auto base = trim(std::string_view(lower).substr(since + 7));

    TimeUnits out;
    if (unit == "days" || unit == "day") {
        out.days_per_unit = 1.0;
    } else if (unit == "hours" || unit == "hour") {
        out.days_per_unit = 1.0 / 24.0;
    } else if (unit == "minutes" || unit == "minute") {
        out.days_per_unit = 1.0 / 1440.0;
    } else if (unit == "seconds" || unit == "second") {
        out.days_per_unit = 1.0 / 86400.0;
    } else {
        return std::nullopt;
    }
    auto date = parse_date(base.substr(0, std::min<std::size_t>(10, base.size())));
    if (!date) {
        return std::nullopt;
    }
    out.origin = *date;
    return out;
}

auto NetcdfGridSource::load(const std::filesystem::path& path, std::string_view variable) const
    -> Result<GridCube> {
    int ncid = 0;
    if (int rc = nc_open(path.c_str(), NC_NOWRITE, &ncid); rc != NC_NOERR) {
        return nc_failure(path, "cannot open", rc);
    }
    NcFile file(ncid);

    auto varid = find_band(ncid, variable);
    if (!varid) {
        return source_read_failure(
            fmt::format("{}: no variable with standard_name '{}'", path.string(), variable));
    }

    int dimids[3] = {};
    if (int rc = nc_inq_vardimid(ncid, *varid, dimids); rc != NC_NOERR) {
        return nc_failure(path, "cannot read dimensions", rc);
    }

    // (time, lat, lon)
    std::vector<double> time;
    std::vector<double> lat;
    std::vector<double> lon;
    if (int rc = read_coordinate(ncid, dimids[0], time); rc != NC_NOERR) {
        return nc_failure(path, "cannot read time axis", rc);
    }
    if (int rc = read_coordinate(ncid, dimids[1], lat); rc != NC_NOERR) {
        return nc_failure(path, "cannot read latitudes", rc);
    }
    if (int rc = read_coordinate(ncid, dimids[2], lon); rc != NC_NOERR) {
        return nc_failure(path, "cannot read longitudes", rc);
    }
    if (lat.size() < 2 || lon.size() < 2) {
        return source_read_failure(
            fmt::format("{}: need at least two latitudes and longitudes to georeference",
                        path.string()));
    }

    int time_var = 0;
    char time_name[NC_MAX_NAME + 1] = {};
    if (int rc = nc_inq_dimname(ncid, dimids[0], time_name); rc != NC_NOERR) {
        return nc_failure(path, "cannot read time dimension", rc);
    }
    if (int rc = nc_inq_varid(ncid, time_name, &time_var); rc != NC_NOERR) {
        return nc_failure(path, "cannot find time variable", rc);
    }
    auto units_text = att_text(ncid, time_var, "units");
    auto units = units_text ? parse_time_units(*units_text) : std::nullopt;
    if (!units) {
        return source_read_failure(fmt::format("{}: unsupported time units '{}'", path.string(),
                                               units_text.value_or("")));
    }
    std::vector<Date> dates;
    dates.reserve(time.size());
    for (double t : time) {
        dates.push_back(days_since(units->origin, t * units->days_per_unit));
    }

    // Coordinates are cell centres; the grid origin is the outer corner.
    GridGeometry geometry;
    geometry.cell_width = lon[1] - lon[0];
    geometry.cell_height = lat[1] - lat[0];
    geometry.origin_x = lon[0] - geometry.cell_width / 2.0;
    geometry.origin_y = lat[0] - geometry.cell_height / 2.0;
    geometry.rows = lat.size();
    geometry.cols = lon.size();

    std::vector<double> values(time.size() * geometry.cell_count());
    if (int rc = nc_get_var_double(ncid, *varid, values.data()); rc != NC_NOERR) {
        return nc_failure(path, "cannot read values", rc);
    }

    auto fill = att_double(ncid, *varid, "_FillValue");
    auto missing = att_double(ncid, *varid, "missing_value");
    double scale = att_double(ncid, *varid, "scale_factor").value_or(1.0);
    double offset = att_double(ncid, *varid, "add_offset").value_or(0.0);
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    for (auto& v : values) {
        if ((fill && v == *fill) || (missing && v == *missing)) {
            v = nan;
        } else {
            v = v * scale + offset;
        }
    }

    spdlog::debug("{}: {} layers of {}x{} cells, origin ({}, {}), cell {} x {}", path.string(),
                  dates.size(), geometry.rows, geometry.cols, geometry.origin_x, geometry.origin_y,
                  geometry.cell_width, geometry.cell_height);

    auto cube = GridCube::create(geometry, std::move(dates), std::move(values), std::nullopt,
                                 std::string(variable));
    if (!cube) {
        return source_read_failure(fmt::format("{}: {}", path.string(), cube.error().message));
    }
    return cube;
}

}  // namespace gridseries::netcdf
