#pragma once

#include <gridseries/config/config.hpp>
#include <gridseries/core/error.hpp>
#include <gridseries/engine/aggregator.hpp>
#include <gridseries/io/series_writer.hpp>
#include <gridseries/io/sources.hpp>

#include <filesystem>
#include <vector>

namespace gridseries::pipeline {

/// The collaborators a run is wired to.
struct Collaborators {
    const io::GridSource* grid = nullptr;
    /// Reads shape files.
    const io::GeographySource* shapes = nullptr;
    /// Reads a points CSV; only needed when RunConfig::points is set.
    const io::GeographySource* points = nullptr;
    const io::SeriesWriter* writer = nullptr;
};

struct TaskOutcome {
    config::Variable variable = config::Variable::tmmx;
    int year = 0;
    std::filesystem::path artifact;
    engine::AggregateReport report;
};

/// Aggregation of one variable for one year into one artifact.
///
/// Inputs are loaded completely before aggregation starts; any load failure
/// aborts before the writer is touched, and the writer only publishes a
/// completely written artifact.
class SeriesTask {
   public:
    SeriesTask(const config::RunConfig& config, config::Variable variable, int year,
               Collaborators collaborators);

    [[nodiscard]] auto artifact() const -> std::filesystem::path;

    [[nodiscard]] auto run() const -> Result<TaskOutcome>;

   private:
    [[nodiscard]] auto load_geographies() const -> Result<GeographySet>;

    const config::RunConfig& config_;
    config::Variable variable_;
    int year_;
    Collaborators with_;
};

/// Run every variable x year task in order, stopping at the first failure.
[[nodiscard]] auto run_all(const config::RunConfig& config, Collaborators collaborators)
    -> Result<std::vector<TaskOutcome>>;

}  // namespace gridseries::pipeline
