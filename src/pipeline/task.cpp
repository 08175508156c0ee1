#include <gridseries/pipeline/task.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace gridseries::pipeline {

SeriesTask::SeriesTask(const config::RunConfig& config, config::Variable variable, int year,
                       Collaborators collaborators)
    : config_(config), variable_(variable), year_(year), with_(collaborators) {}

auto SeriesTask::artifact() const -> std::filesystem::path {
    std::string_view ext = with_.writer != nullptr ? with_.writer->extension() : "out";
    return config_.destination / config::artifact_name(config_, variable_, year_, ext);
}

auto SeriesTask::load_geographies() const -> Result<GeographySet> {
    if (!config_.points.empty()) {
        if (with_.points == nullptr) {
            return invalid_parameter("no points reader configured");
        }
        return with_.points->load(io::GeographyQuery{
            .path = config_.points, .id_field = config_.metadata.front(), .kind = ShapeKind::Point});
    }
    if (with_.shapes == nullptr) {
        return invalid_parameter("no shape file reader configured");
    }
    auto shape_file =
        config::find_shape_file(config_.shapes_dir, year_, config_.geography.name, config_.shape);
    if (!shape_file) {
        return std::unexpected(shape_file.error());
    }
    spdlog::info("using shape file {}", shape_file->string());
    return with_.shapes->load(io::GeographyQuery{
        .path = *shape_file, .id_field = config_.geography.id_field, .kind = config_.shape});
}

auto SeriesTask::run() const -> Result<TaskOutcome> {
    if (with_.grid == nullptr || with_.writer == nullptr) {
        return invalid_parameter("grid reader and series writer are required");
    }
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    auto strategy = config_.rasterization();
    if (!strategy) {
        return std::unexpected(strategy.error());
    }

    const auto name = config::to_string(variable_);
    const auto started = std::chrono::steady_clock::now();
    const auto grid_path = config::grid_file(config_, variable_, year_);
    spdlog::info("{} {}: {} => {}", name, year_, grid_path.string(), artifact().string());

    auto cube = with_.grid->load(grid_path, name);
    if (!cube) {
        return std::unexpected(cube.error());
    }
    auto geographies = load_geographies();
    if (!geographies) {
        return std::unexpected(geographies.error());
    }

    engine::AggregateOptions options;
    options.threads = config_.threads;
    if (config_.dates) {
        options.date_filter = [filter = *config_.dates](Date d) { return filter.accept(d); };
    }
    if (!config_.points.empty()) {
        // first metadata column is the id; the rest ride along
        options.metadata_columns.assign(config_.metadata.begin() + 1, config_.metadata.end());
    }

    auto result = engine::aggregate(*cube, *geographies, *strategy, options);
    if (!result) {
        return std::unexpected(result.error());
    }

    auto& table = result->table;
    table.id_column = config_.points.empty() ? config_.geography.id_column : config_.metadata.front();
    table.value_column = std::string(name);

    const auto path = artifact();
    auto written = with_.writer->write(table, path);
    if (!written) {
        return std::unexpected(written.error());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(
                       std::chrono::steady_clock::now() - started)
                       .count();
    spdlog::info("{} {}: completed in {:.1f}s", name, year_, elapsed);
    return TaskOutcome{
        .variable = variable_, .year = year_, .artifact = path, .report = result->report};
}

auto run_all(const config::RunConfig& config, Collaborators collaborators)
    -> Result<std::vector<TaskOutcome>> {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    std::vector<TaskOutcome> outcomes;
    for (int year : config.years) {
        for (auto variable : config.variables) {
            SeriesTask task(config, variable, year, collaborators);
            auto outcome = task.run();
            if (!outcome) {
                spdlog::error("{} {}: {}", config::to_string(variable), year,
                              outcome.error().format());
                return std::unexpected(outcome.error());
            }
            outcomes.push_back(std::move(*outcome));
        }
    }
    return outcomes;
}

}  // namespace gridseries::pipeline
