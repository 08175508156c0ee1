#pragma once

#include <gridseries/core/column.hpp>
#include <gridseries/core/time.hpp>

#include <string>
#include <vector>

namespace gridseries::engine {

/// One aggregated value for a geography on a day.
struct SeriesRow {
    std::string geography_id;
    Date date;
    double value = 0.0;
    auto operator==(const SeriesRow&) const -> bool = default;
};

/// Columnar per-geography/per-day output, rows ordered by geography and then
/// by date. Column names default to the interchange layout
/// {geography_id, date, value}; runs rename them after the geography type and
/// the variable.
struct SeriesTable {
    std::string id_column = "geography_id";
    std::string date_column = "date";
    std::string value_column = "value";

    Column<std::string> geography_ids;
    Column<Date> dates;
    Column<double> values;

    /// Optional extra per-row id columns (point metadata), written after the
    /// value column.
    std::vector<std::string> metadata_columns;
    std::vector<Column<std::string>> metadata;

    [[nodiscard]] auto rows() const noexcept -> std::size_t { return values.size(); }

    void append(SeriesRow row);

    /// Append a row carrying metadata values (one per metadata column).
    void append(SeriesRow row, const std::vector<std::string>& extra);

    /// Move every row of `other` (same column layout) to the end.
    void append(SeriesTable&& other);

    [[nodiscard]] auto row(std::size_t idx) const -> SeriesRow;
};

}  // namespace gridseries::engine
