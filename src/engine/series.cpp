#include <gridseries/engine/series.hpp>

#include <stdexcept>

namespace gridseries::engine {

void SeriesTable::append(SeriesRow row) {
    geography_ids.push_back(std::move(row.geography_id));
    dates.push_back(row.date);
    values.push_back(row.value);
}

void SeriesTable::append(SeriesRow row, const std::vector<std::string>& extra) {
    if (extra.size() != metadata_columns.size()) {
        throw std::invalid_argument("SeriesTable::append: metadata width mismatch");
    }
    metadata.resize(metadata_columns.size());
    for (std::size_t i = 0; i < extra.size(); ++i) {
        metadata[i].push_back(extra[i]);
    }
    append(std::move(row));
}

void SeriesTable::append(SeriesTable&& other) {
    geography_ids.append(std::move(other.geography_ids));
    dates.append(std::move(other.dates));
    values.append(std::move(other.values));
    metadata.resize(metadata_columns.size());
    for (std::size_t i = 0; i < other.metadata.size() && i < metadata.size(); ++i) {
        metadata[i].append(std::move(other.metadata[i]));
    }
}

auto SeriesTable::row(std::size_t idx) const -> SeriesRow {
    return SeriesRow{.geography_id = geography_ids.at(idx),
                     .date = dates.at(idx),
                     .value = values.at(idx)};
}

}  // namespace gridseries::engine
