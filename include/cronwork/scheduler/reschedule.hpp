#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/storage/task.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cronwork {

enum class RunOutcome : std::uint8_t {
  Completed,
  Failed,
  TimedOut,
  Cancelled,
};

enum class RetryMode : std::uint8_t {
  Immediate,  // re-queue at the failure time
  Delayed,    // re-queue after RetryPolicy::delay
  Schedule,   // re-queue at the next regular fire time
};

struct RetryPolicy {
  RetryMode mode{RetryMode::Immediate};
  std::chrono::seconds delay{0};
};

[[nodiscard]] auto retry_mode_name(RetryMode mode) noexcept -> const char*;
[[nodiscard]] auto parse_retry_mode(std::string_view name) noexcept
    -> std::optional<RetryMode>;

[[nodiscard]] auto run_status_for(RunOutcome outcome) noexcept -> RunStatus;

// First fire time of a freshly registered task.
[[nodiscard]] auto first_fire_time(const Task& task, TimePoint now)
    -> Result<TimePoint>;

// Next regular fire strictly after max(finish, task.next_run_time), or
// nullopt when the task has no further fires (one-shot).
[[nodiscard]] auto next_fire_time(const Task& task, TimePoint finish)
    -> std::optional<TimePoint>;

// Counters, status and next fire time after a run of `task` ended with
// `outcome` at `finish`.
[[nodiscard]] auto decide_next(const Task& task, RunOutcome outcome,
                               TimePoint finish, const RetryPolicy& policy)
    -> TaskUpdate;

}  // namespace cronwork
