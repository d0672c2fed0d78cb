#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/dag/dependency_graph.hpp"
#include "cronwork/executor/function_registry.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cronwork {

struct TaskOptions {
  std::string task_name;
  std::string group_name{kDefaultGroup};
  std::string uuid;  // generated when empty
  std::string cron;
  std::optional<TimePoint> start_time;  // defaults to now
  std::chrono::seconds period{0};
  std::optional<TimePoint> stop_time;
  int repeats{1};
  std::chrono::seconds timeout{60};
  int retry_failed{0};
  bool prevent_drift{false};
  bool immediate{false};
  std::chrono::seconds sync_output_interval{0};
  bool enabled{true};
  std::vector<TaskId> depends_on;
  std::string job_name;
  bool overwrite{false};
};

struct QueueResult {
  TaskId id{kInvalidTaskId};
  std::string uuid;
  std::vector<std::string> errors;

  [[nodiscard]] auto ok() const noexcept -> bool {
    return errors.empty();
  }
};

class TaskClient {
public:
  using ClockFn = std::function<TimePoint()>;

  // With a function registry, function names are checked at registration.
  explicit TaskClient(TaskRegistry& registry,
                      const FunctionRegistry* functions = nullptr,
                      ClockFn clock = [] { return Clock::now(); });

  // Validation problems land in QueueResult::errors with nothing persisted;
  // the Result error is reserved for storage failures.
  [[nodiscard]] auto queue_task(std::string_view function_ref,
                                nlohmann::json args, nlohmann::json kwargs,
                                const TaskOptions& options)
      -> Result<QueueResult>;

  [[nodiscard]] auto add_dependencies(std::string_view job_name,
                                      std::span<const DependencyEdge> edges)
      -> Result<void>;

  [[nodiscard]] auto task_status(const TaskQuery& query,
                                 bool include_output = false)
      -> Result<std::vector<Task>>;

  [[nodiscard]] auto stop_task(TaskId id) -> Result<TaskStatus>;
  [[nodiscard]] auto stop_task(const TaskUuid& uuid) -> Result<TaskStatus>;

  [[nodiscard]] auto validate(std::string_view function_ref,
                              const nlohmann::json& args,
                              const nlohmann::json& kwargs,
                              const TaskOptions& options) const
      -> std::vector<std::string>;

private:
  TaskRegistry& registry_;
  const FunctionRegistry* functions_;
  ClockFn clock_;
};

}  // namespace cronwork
