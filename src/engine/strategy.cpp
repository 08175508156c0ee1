#include <gridseries/engine/strategy.hpp>

#include <fmt/format.h>

namespace gridseries::engine {

auto to_string(Strategy strategy) -> std::string_view {
    switch (strategy) {
        case Strategy::Default:
            return "default";
        case Strategy::AllTouched:
            return "all_touched";
        case Strategy::Combined:
            return "combined";
        case Strategy::Downscale:
            return "downscale";
    }
    return "unknown";
}

auto parse_strategy(std::string_view name) -> Result<Strategy> {
    for (auto s : {Strategy::Default, Strategy::AllTouched, Strategy::Combined,
                   Strategy::Downscale}) {
        if (name == to_string(s)) {
            return s;
        }
    }
    return invalid_parameter(fmt::format(
        "unknown rasterization strategy '{}' (expected default, all_touched, combined or "
        "downscale)",
        name));
}

auto RasterizationStrategy::make(Strategy kind, std::int64_t factor, Strategy refinement)
    -> Result<RasterizationStrategy> {
    RasterizationStrategy out;
    out.kind_ = kind;
    if (kind != Strategy::Downscale) {
        return out;
    }
    if (factor < 1) {
        return invalid_parameter(
            fmt::format("downscale factor must be a positive integer (got {})", factor));
    }
    if (refinement != Strategy::AllTouched && refinement != Strategy::Combined) {
        return invalid_parameter(
            fmt::format("downscale refinement must be all_touched or combined (got {})",
                        to_string(refinement)));
    }
    out.factor_ = static_cast<std::size_t>(factor);
    out.refinement_ = refinement;
    return out;
}

}  // namespace gridseries::engine
