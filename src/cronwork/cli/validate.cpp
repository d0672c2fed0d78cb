#include "cronwork/cli/commands.hpp"
#include "cronwork/scheduler/cron.hpp"
#include "cronwork/util/util.hpp"

#include <print>

namespace cronwork::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  if (auto why = CronExpr::explain(opts.cron); !why.empty()) {
    std::println(stderr, "Invalid: {}", why);
    return 1;
  }

  auto expr = CronExpr::parse(opts.cron);
  if (!expr) {
    std::println(stderr, "Invalid: {}", expr.error().message());
    return 1;
  }

  std::println("Valid: {}", expr->raw());
  auto fires = expr->all_between(Clock::now(), TimePoint::max(),
                                 static_cast<std::size_t>(opts.count));
  if (fires.empty()) {
    std::println("No fire times within the search horizon.");
    return 0;
  }
  std::println("Next {} fire times (UTC):", fires.size());
  for (auto tp : fires) {
    std::println("  {}", format_time(tp));
  }
  return 0;
}

}  // namespace cronwork::cli
