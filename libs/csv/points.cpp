#include "points.hpp"

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <string_view>

namespace gridseries::csv {

namespace {

auto csv_try_double(const std::string& text, double& out) -> bool {
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

}  // namespace

CsvPointSource::CsvPointSource(std::string x_column, std::string y_column,
                               std::vector<std::string> metadata_columns)
    : x_column_(std::move(x_column)),
      y_column_(std::move(y_column)),
      metadata_columns_(std::move(metadata_columns)) {}

auto CsvPointSource::load(const io::GeographyQuery& query) const -> Result<GeographySet> {
    const auto path = query.path.string();
    std::vector<std::string> ids;
    std::vector<std::string> xs;
    std::vector<std::string> ys;
    std::vector<std::vector<std::string>> extra;
    try {
        rapidcsv::Document doc(path,
                               rapidcsv::LabelParams(0, -1),   // row 0 = header
                               rapidcsv::SeparatorParams(','));
        auto names = doc.GetColumnNames();
        auto require = [&](const std::string& column) -> Result<void> {
            if (std::ranges::find(names, column) == names.end()) {
                return source_read_failure(fmt::format("{}: no column '{}'", path, column));
            }
            return {};
        };
        for (const auto* column : {&query.id_field, &x_column_, &y_column_}) {
            if (auto ok = require(*column); !ok) {
                return std::unexpected(ok.error());
            }
        }
        for (const auto& column : metadata_columns_) {
            if (auto ok = require(column); !ok) {
                return std::unexpected(ok.error());
            }
        }
        ids = doc.GetColumn<std::string>(query.id_field);
        xs = doc.GetColumn<std::string>(x_column_);
        ys = doc.GetColumn<std::string>(y_column_);
        for (const auto& column : metadata_columns_) {
            extra.push_back(doc.GetColumn<std::string>(column));
        }
    } catch (const std::exception& e) {
        return source_read_failure(fmt::format("{}: {}", path, e.what()));
    }

    GeographySet out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        Point location;
        if (!csv_try_double(xs[i], location.x) || !csv_try_double(ys[i], location.y) ||
            !std::isfinite(location.x) || !std::isfinite(location.y)) {
            return source_read_failure(fmt::format("{}: row {} ('{}') has invalid coordinates",
                                                   path, i + 1, ids[i]));
        }
        auto geography = Geography::point(ids[i], location);
        std::vector<std::string> metadata;
        metadata.reserve(extra.size());
        for (const auto& column : extra) {
            metadata.push_back(column[i]);
        }
        geography.set_metadata(std::move(metadata));
        if (auto added = out.add(std::move(geography)); !added) {
            return source_read_failure(fmt::format("{}: {}", path, added.error().message));
        }
    }
    spdlog::debug("{}: loaded {} points", path, out.size());
    return out;
}

}  // namespace gridseries::csv
