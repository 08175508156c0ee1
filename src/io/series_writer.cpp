#include <gridseries/io/series_writer.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace gridseries::io {

auto partial_path(const std::filesystem::path& path) -> std::filesystem::path {
    auto out = path;
    out += ".partial";
    return out;
}

auto SeriesWriter::write(const engine::SeriesTable& table, const std::filesystem::path& path) const
    -> Result<std::size_t> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return write_failure(fmt::format("cannot create directory {}: {}",
                                             path.parent_path().string(), ec.message()));
        }
    }

    const auto tmp = partial_path(path);
    auto written = write_file(table, tmp);
    if (!written) {
        std::filesystem::remove(tmp, ec);
        return std::unexpected(written.error());
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        auto message = fmt::format("cannot move {} into place: {}", path.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return write_failure(std::move(message));
    }
    spdlog::info("wrote {} rows to {}", table.rows(), path.string());
    return table.rows();
}

auto CsvSeriesWriter::write_file(const engine::SeriesTable& table,
                                 const std::filesystem::path& path) const -> Result<void> {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return write_failure(fmt::format("cannot open {} for writing", path.string()));
    }

    out << table.id_column << ',' << table.date_column << ',' << table.value_column;
    for (const auto& name : table.metadata_columns) {
        out << ',' << name;
    }
    out << '\n';

    std::string line;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        line.clear();
        fmt::format_to(std::back_inserter(line), "{},{},{}", table.geography_ids[i],
                       format_date(table.dates[i]), table.values[i]);
        for (const auto& column : table.metadata) {
            line.push_back(',');
            line.append(column[i]);
        }
        line.push_back('\n');
        out << line;
    }

    out.flush();
    if (!out) {
        return write_failure(fmt::format("failed writing {}", path.string()));
    }
    return {};
}

}  // namespace gridseries::io
