#include "cronwork/scheduler/reschedule.hpp"

#include "cronwork/scheduler/cron.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace cronwork {

namespace {

constexpr std::array<std::string_view, 3> kRetryModeNames = {
    "immediate",
    "delayed",
    "schedule",
};

auto past_stop(const Task& task, TimePoint tp) -> bool {
  return task.stop_time && tp > *task.stop_time;
}

}  // namespace

auto retry_mode_name(RetryMode mode) noexcept -> const char* {
  auto idx = std::to_underlying(mode);
  return idx < kRetryModeNames.size() ? kRetryModeNames[idx].data()
                                      : "immediate";
}

auto parse_retry_mode(std::string_view name) noexcept
    -> std::optional<RetryMode> {
  auto it = std::ranges::find(kRetryModeNames, name);
  if (it == kRetryModeNames.end()) {
    return std::nullopt;
  }
  return static_cast<RetryMode>(
      std::ranges::distance(kRetryModeNames.begin(), it));
}

auto run_status_for(RunOutcome outcome) noexcept -> RunStatus {
  switch (outcome) {
    case RunOutcome::Completed:
      return RunStatus::Completed;
    case RunOutcome::Failed:
      return RunStatus::Failed;
    case RunOutcome::TimedOut:
      return RunStatus::Timeout;
    case RunOutcome::Cancelled:
      return RunStatus::Stopped;
  }
  return RunStatus::Failed;
}

auto first_fire_time(const Task& task, TimePoint now) -> Result<TimePoint> {
  if (task.immediate) {
    return now;
  }

  if (!task.cron.empty()) {
    auto expr = CronExpr::parse(task.cron);
    if (!expr) {
      return fail(expr.error());
    }
    auto next = expr->next_after(std::max(now, task.start_time));
    if (next == TimePoint::max()) {
      return fail(Error::InvalidArgument);
    }
    return next;
  }

  return task.start_time == TimePoint{} ? now : task.start_time;
}

auto next_fire_time(const Task& task, TimePoint finish)
    -> std::optional<TimePoint> {
  const TimePoint reference = std::max(finish, task.next_run_time);

  if (!task.cron.empty()) {
    auto expr = CronExpr::parse(task.cron);
    if (!expr) {
      return std::nullopt;
    }
    auto next = expr->next_after(reference);
    if (next == TimePoint::max()) {
      return std::nullopt;
    }
    return next;
  }

  if (task.period.count() > 0) {
    if (!task.prevent_drift) {
      return finish + task.period;
    }
    // Stay on the start_time + N*period grid, skipping missed slots.
    if (reference < task.start_time) {
      return task.start_time;
    }
    auto n = (reference - task.start_time) / task.period + 1;
    return task.start_time + n * task.period;
  }

  return std::nullopt;
}

auto decide_next(const Task& task, RunOutcome outcome, TimePoint finish,
                 const RetryPolicy& policy) -> TaskUpdate {
  TaskUpdate update{.status = TaskStatus::Queued,
                    .next_run_time = task.next_run_time,
                    .repeats = task.repeats,
                    .retry_failed = task.retry_failed,
                    .times_failed = task.times_failed,
                    .times_run = task.times_run};

  switch (outcome) {
    case RunOutcome::Completed: {
      ++update.times_run;
      if (task.repeats > 0) {
        update.repeats = task.repeats - 1;
        if (update.repeats == 0) {
          update.status = TaskStatus::Completed;
          return update;
        }
      }
      auto next = next_fire_time(task, finish);
      if (!next || past_stop(task, *next)) {
        update.status = TaskStatus::Completed;
        return update;
      }
      update.next_run_time = *next;
      return update;
    }

    case RunOutcome::Failed:
    case RunOutcome::TimedOut: {
      ++update.times_run;
      ++update.times_failed;
      const auto terminal = outcome == RunOutcome::Failed ? TaskStatus::Failed
                                                          : TaskStatus::Timeout;
      if (task.retry_failed <= 0) {
        update.status = terminal;
        return update;
      }

      TimePoint next = finish;
      switch (policy.mode) {
        case RetryMode::Immediate:
          break;
        case RetryMode::Delayed:
          next = finish + policy.delay;
          break;
        case RetryMode::Schedule:
          next = next_fire_time(task, finish).value_or(finish);
          break;
      }
      if (past_stop(task, next)) {
        update.status = terminal;
        return update;
      }
      update.retry_failed = task.retry_failed - 1;
      update.next_run_time = next;
      return update;
    }

    case RunOutcome::Cancelled:
      update.status = TaskStatus::Stopped;
      return update;
  }

  return update;
}

}  // namespace cronwork
