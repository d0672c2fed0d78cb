#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/executor/child_process.hpp"
#include "cronwork/executor/function_registry.hpp"
#include "cronwork/scheduler/reschedule.hpp"
#include "cronwork/storage/recovery.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cronwork {

struct WorkerOptions {
  std::string name;  // empty = host#pid
  std::vector<std::string> groups{std::string(kDefaultGroup)};
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::milliseconds heartbeat_interval{3000};
  std::chrono::milliseconds stale_after{30000};
  std::chrono::milliseconds cancel_check_interval{1000};
  int max_empty_runs{0};  // 0 = never exit on idleness
  std::size_t poll_limit{16};
  RetryPolicy retry;
};

enum class TickOutcome : std::uint8_t {
  Idle,         // nothing due, ready and claimable
  Executed,     // ran one task to completion
  Paused,       // DISABLED by an operator
  Terminating,  // TERMINATING by an operator
};

// One worker process: heartbeat, housekeeping, poll, claim, execute in a
// child, write back. Single-threaded with one execution slot.
class Worker {
public:
  using ClockFn = std::function<TimePoint()>;

  Worker(TaskRegistry& registry, const FunctionRegistry& functions,
         WorkerOptions options, ClockFn clock = [] { return Clock::now(); });

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // Upserts the worker row and runs housekeeping. Returns the status an
  // operator last set for this worker.
  [[nodiscard]] auto heartbeat() -> Result<WorkerStatus>;

  // One poll cycle; heartbeats first when the interval has elapsed.
  [[nodiscard]] auto run_once() -> Result<TickOutcome>;

  // Polls every tick until `stop` is set, an operator terminates the worker
  // or max_empty_runs consecutive polls came back empty. Removes the worker
  // row on the way out.
  auto run(const std::atomic<bool>& stop) -> void;

  auto shutdown() -> void;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return options_.name;
  }
  [[nodiscard]] auto status() const noexcept -> WorkerStatus {
    return status_;
  }

private:
  [[nodiscard]] auto heartbeat_due() const -> bool;
  [[nodiscard]] auto claim_next(TimePoint now) -> Result<std::optional<Task>>;
  auto execute(const Task& task) -> void;
  // Writes a finished run back; ok() also when the task was taken away.
  [[nodiscard]] auto record(const RunCompletion& completion) -> Result<void>;
  [[nodiscard]] auto release(TaskId id) -> Result<void>;
  // Retries a release or run write-back that failed on an earlier tick.
  [[nodiscard]] auto flush_pending() -> Result<void>;
  [[nodiscard]] auto run_child(const Task& task, RunId run_id) -> ChildResult;
  auto sleep_tick(const std::atomic<bool>& stop) const -> void;

  TaskRegistry& registry_;
  const FunctionRegistry& functions_;
  WorkerOptions options_;
  ClockFn clock_;
  Recovery recovery_;
  WorkerStatus status_{WorkerStatus::Active};
  std::optional<std::chrono::steady_clock::time_point> last_heartbeat_;
  int empty_runs_{0};
  std::optional<TaskId> pending_release_;
  std::optional<RunCompletion> pending_completion_;
};

[[nodiscard]] auto default_worker_name() -> std::string;

}  // namespace cronwork
