#pragma once

#include <gridseries/core/error.hpp>
#include <gridseries/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridseries::config {

/// Restricts which days of a run are aggregated (debugging aid).
///
/// Accepted forms:
///   2001-03-01:2001-03-31    inclusive date range (either bound may be empty)
///   dayofmonth:1,15          days of month
///   month:1,2,12             months
///   date:01-15,7-4           month-day pairs, leading zeros optional
class DateFilter {
   public:
    enum class Kind : std::uint8_t { Range, DayOfMonth, Month, MonthDay };

    [[nodiscard]] static auto parse(std::string_view text) -> Result<DateFilter>;

    [[nodiscard]] auto kind() const noexcept -> Kind { return kind_; }
    [[nodiscard]] auto accept(Date date) const -> bool;

   private:
    Kind kind_ = Kind::Range;
    std::optional<Date> min_;
    std::optional<Date> max_;
    // (month << 8) | day for MonthDay, plain numbers otherwise
    std::vector<unsigned> values_;
};

}  // namespace gridseries::config
