#pragma once

#include <gridseries/core/error.hpp>
#include <gridseries/engine/series.hpp>

#include <filesystem>
#include <string_view>

namespace gridseries::io {

/// Serializes a SeriesTable to one artifact.
///
/// write() produces the file under a temporary sibling name and renames it
/// into place only once the format writer succeeded, so an artifact that
/// exists is always complete. On failure nothing is left behind.
class SeriesWriter {
   public:
    virtual ~SeriesWriter() = default;

    /// Returns the number of rows written.
    [[nodiscard]] auto write(const engine::SeriesTable& table,
                             const std::filesystem::path& path) const -> Result<std::size_t>;

    /// File extension without the dot, e.g. "csv".
    [[nodiscard]] virtual auto extension() const -> std::string_view = 0;

   protected:
    [[nodiscard]] virtual auto write_file(const engine::SeriesTable& table,
                                          const std::filesystem::path& path) const
        -> Result<void> = 0;
};

/// Uncompressed CSV: header line, ISO dates, shortest round-trip doubles.
/// The compressed artifact is ParquetSeriesWriter's.
class CsvSeriesWriter final : public SeriesWriter {
   public:
    [[nodiscard]] auto extension() const -> std::string_view override { return "csv"; }

   protected:
    [[nodiscard]] auto write_file(const engine::SeriesTable& table,
                                  const std::filesystem::path& path) const
        -> Result<void> override;
};

/// Temporary name used while an artifact is being written.
[[nodiscard]] auto partial_path(const std::filesystem::path& path) -> std::filesystem::path;

}  // namespace gridseries::io
