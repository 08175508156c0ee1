#pragma once
// gridseries Parquet library: compressed columnar artifacts via Apache Arrow.
//
// Layout of a series artifact:
//   <id column>     UTF8
//   date            DATE32
//   <variable>      DOUBLE
//   <metadata...>   UTF8

#include <gridseries/io/series_writer.hpp>

#include <filesystem>

namespace gridseries::parquet {

/// ZSTD-compressed Parquet output.
class ParquetSeriesWriter final : public io::SeriesWriter {
   public:
    [[nodiscard]] auto extension() const -> std::string_view override { return "parquet"; }

   protected:
    [[nodiscard]] auto write_file(const engine::SeriesTable& table,
                                  const std::filesystem::path& path) const
        -> Result<void> override;
};

/// Read a series artifact back. Column names are taken from the file schema.
[[nodiscard]] auto read_series(const std::filesystem::path& path) -> Result<engine::SeriesTable>;

}  // namespace gridseries::parquet
