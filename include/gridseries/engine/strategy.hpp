#pragma once

#include <gridseries/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gridseries::engine {

/// Rule for mapping grid cells onto a geography.
enum class Strategy : std::uint8_t {
    Default,     ///< single cell under the representative point
    AllTouched,  ///< equal weight over every overlapped cell
    Combined,    ///< weight by overlapped area
    Downscale,   ///< supersample the grid, then AllTouched or Combined
};

[[nodiscard]] auto to_string(Strategy strategy) -> std::string_view;

/// Accepts "default", "all_touched", "combined", "downscale".
[[nodiscard]] auto parse_strategy(std::string_view name) -> Result<Strategy>;

/// A strategy together with its downscale parameters. Only constructible
/// through make(), so an instance is always valid.
class RasterizationStrategy {
   public:
    static constexpr std::int64_t kDefaultDownscaleFactor = 5;

    RasterizationStrategy() = default;

    /// `factor` and `refinement` only apply to Strategy::Downscale;
    /// factor must be >= 1 and refinement AllTouched or Combined.
    [[nodiscard]] static auto make(Strategy kind,
                                   std::int64_t factor = kDefaultDownscaleFactor,
                                   Strategy refinement = Strategy::AllTouched)
        -> Result<RasterizationStrategy>;

    [[nodiscard]] auto kind() const noexcept -> Strategy { return kind_; }

    /// Grid supersampling factor; 1 for every strategy except Downscale.
    [[nodiscard]] auto factor() const noexcept -> std::size_t { return factor_; }

    /// The weighting rule applied to the (possibly downscaled) grid.
    [[nodiscard]] auto weighting() const noexcept -> Strategy {
        return kind_ == Strategy::Downscale ? refinement_ : kind_;
    }

   private:
    Strategy kind_ = Strategy::Default;
    std::size_t factor_ = 1;
    Strategy refinement_ = Strategy::AllTouched;
};

}  // namespace gridseries::engine
