#pragma once

#include "cronwork/util/id.hpp"
#include "cronwork/util/util.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cronwork {

enum class TaskStatus : std::uint8_t {
  Queued,
  Assigned,
  Running,
  Completed,
  Failed,
  Timeout,
  Stopped,
  Expired,
};

enum class RunStatus : std::uint8_t {
  Running,
  Completed,
  Failed,
  Timeout,
  Stopped,
};

enum class WorkerStatus : std::uint8_t {
  Active,
  Disabled,
  Terminating,
};

inline constexpr std::string_view kDefaultGroup = "main";
inline constexpr std::string_view kDefaultJob = "default";

struct Task {
  TaskId id{kInvalidTaskId};
  std::string uuid;
  std::string task_name;
  std::string group_name{kDefaultGroup};
  std::string function_ref;
  nlohmann::json args = nlohmann::json::array();
  nlohmann::json kwargs = nlohmann::json::object();

  // Schedule: cron, or start_time + period, or a one-shot start_time.
  std::string cron;
  TimePoint start_time{};
  std::chrono::seconds period{0};
  std::optional<TimePoint> stop_time;

  int repeats{1};  // remaining executions, 0 = unlimited
  int times_run{0};
  bool prevent_drift{false};
  std::chrono::seconds timeout{60};
  int retry_failed{0};
  int times_failed{0};
  bool immediate{false};
  std::chrono::seconds sync_output_interval{0};

  TimePoint next_run_time{};
  TaskStatus status{TaskStatus::Queued};
  std::string assigned_worker;
  TimePoint last_run_time{};
  bool enabled{true};

  // Latest run; filled only when output is requested.
  std::string output;
  nlohmann::json result;

  [[nodiscard]] auto is_periodic() const noexcept -> bool {
    return !cron.empty() || period.count() > 0;
  }
};

struct RunRecord {
  RunId id{kInvalidRunId};
  TaskId task_id{kInvalidTaskId};
  RunStatus status{RunStatus::Running};
  TimePoint start_time{};
  TimePoint stop_time{};
  std::string output;
  std::string result;
  std::string traceback;
  std::string worker_name;
};

struct WorkerInfo {
  std::string worker_name;
  std::vector<std::string> group_names;
  TimePoint first_heartbeat{};
  TimePoint last_heartbeat{};
  WorkerStatus status{WorkerStatus::Active};
};

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  switch (status) {
    case TaskStatus::Queued:
    case TaskStatus::Assigned:
    case TaskStatus::Running:
      return false;
    default:
      return true;
  }
}

}  // namespace cronwork
