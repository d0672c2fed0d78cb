#pragma once

#include "cronwork/core/error.hpp"

#include <bitset>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cronwork {

// Five-field cron expression: minute hour day-of-month month weekday.
// Evaluated in UTC at minute granularity.
class CronExpr {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  CronExpr() = default;

  [[nodiscard]] static auto parse(std::string_view expr) -> Result<CronExpr>;

  // Human-readable reason why `expr` does not parse; empty if it does.
  [[nodiscard]] static auto explain(std::string_view expr) -> std::string;

  // First matching minute strictly after `after`, or TimePoint::max() if no
  // match exists within the search horizon.
  [[nodiscard]] auto next_after(TimePoint after) const -> TimePoint;

  [[nodiscard]] auto all_between(TimePoint start, TimePoint end,
                                 std::size_t max_count) const
      -> std::vector<TimePoint>;

  [[nodiscard]] auto matches(TimePoint tp) const -> bool;

  [[nodiscard]] auto raw() const noexcept -> std::string_view {
    return raw_;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return raw_.empty();
  }

  struct Fields {
    std::bitset<60> minute;
    std::bitset<24> hour;
    std::bitset<32> dom;
    std::bitset<13> month;
    std::bitset<7> dow;
    bool dom_last{false};
    bool dom_restricted{false};
    bool dow_restricted{false};
  };

private:
  CronExpr(std::string raw, Fields fields);

  [[nodiscard]] auto day_matches(std::chrono::year_month_day ymd) const
      -> bool;

  std::string raw_;
  Fields fields_;
};

}  // namespace cronwork
