#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/dag/dependency_graph.hpp"
#include "cronwork/storage/task.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace cronwork {

struct TaskUuid {
  std::string value;
};

struct TaskFilter {
  std::optional<TaskStatus> status;
  std::string group_name;
  std::string task_name;
  std::string function_ref;
  std::function<bool(const Task&)> predicate;
};

using TaskQuery = std::variant<TaskId, TaskUuid, TaskFilter>;

// Counters and schedule written back when a run finishes.
struct TaskUpdate {
  TaskStatus status{TaskStatus::Queued};
  TimePoint next_run_time{};
  int repeats{0};
  int retry_failed{0};
  int times_failed{0};
  int times_run{0};
};

struct RunCompletion {
  TaskId task_id{kInvalidTaskId};
  RunId run_id{kInvalidRunId};
  std::string worker_name;
  RunStatus run_status{RunStatus::Completed};
  TimePoint finished{};
  std::string output;
  std::string result;
  std::string traceback;
  TaskUpdate update;
};

struct ReclaimResult {
  int workers_removed{0};
  int tasks_requeued{0};
  int runs_failed{0};
};

// Edges of every job plus, per task involved in one, the newest completed
// run. A predecessor counts as done for a successor only if it completed
// after the successor's own last completed run started.
struct DependencySnapshot {
  DependencyGraphSet graphs;
  std::unordered_map<TaskId, TimePoint> last_completed_stop;
  std::unordered_map<TaskId, TimePoint> last_completed_start;

  [[nodiscard]] auto completed_for(TaskId successor) const -> CompletedSet;
  [[nodiscard]] auto ready(TaskId task_id) const -> bool {
    return graphs.ready(task_id, completed_for(task_id));
  }
};

// Coordination store shared by every worker process. Each instance owns one
// SQLite connection; all cross-process exclusion goes through conditional
// updates and IMMEDIATE transactions on that connection.
class TaskRegistry {
public:
  explicit TaskRegistry(
      std::string_view db_path,
      std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~TaskRegistry();

  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }
  [[nodiscard]] auto path() const noexcept -> std::string_view {
    return db_path_;
  }

  // Tasks
  // Inserts `task` and, when `depends_on` is non-empty, the edges
  // depends_on[i] -> task under `job_name`, in one transaction.
  [[nodiscard]] auto insert_task(const Task& task,
                                 std::string_view job_name = {},
                                 std::span<const TaskId> depends_on = {})
      -> Result<TaskId>;
  // Replaces the definition stored under task.uuid and re-queues it.
  // TaskRunning while a worker holds the task ASSIGNED or RUNNING.
  [[nodiscard]] auto replace_task(const Task& task,
                                  std::string_view job_name = {},
                                  std::span<const TaskId> depends_on = {})
      -> Result<TaskId>;
  [[nodiscard]] auto get_task(TaskId id) -> Result<Task>;
  [[nodiscard]] auto find_tasks(const TaskQuery& query,
                                bool include_output = false)
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto task_status_of(TaskId id) -> Result<TaskStatus>;
  [[nodiscard]] auto set_task_enabled(TaskId id, bool enabled) -> Result<void>;
  // QUEUED/ASSIGNED/RUNNING -> STOPPED. Terminal tasks keep their status.
  [[nodiscard]] auto stop_task(TaskId id) -> Result<TaskStatus>;
  [[nodiscard]] auto stop_task(const TaskUuid& uuid) -> Result<TaskStatus>;

  // Claim protocol
  [[nodiscard]] auto due_tasks(TimePoint now,
                               std::span<const std::string> groups,
                               std::size_t limit) -> Result<std::vector<Task>>;
  // QUEUED -> ASSIGNED iff still queued, enabled and dependency-ready.
  // ClaimLost when another worker (or a status change) got there first.
  [[nodiscard]] auto claim(TaskId id, std::string_view worker_name)
      -> Result<void>;
  // ASSIGNED -> QUEUED for a claim that `worker_name` cannot start.
  [[nodiscard]] auto release_claim(TaskId id, std::string_view worker_name)
      -> Result<void>;
  // ASSIGNED -> RUNNING for the claiming worker, opening a run record.
  [[nodiscard]] auto start_run(TaskId id, std::string_view worker_name,
                               TimePoint start) -> Result<RunId>;
  [[nodiscard]] auto sync_run_output(RunId run_id, std::string_view output)
      -> Result<void>;
  // Closes the run and writes the task update. A task stopped meanwhile keeps
  // STOPPED and its run is recorded STOPPED; a task reclaimed meanwhile is
  // left alone and ClaimLost is returned.
  [[nodiscard]] auto complete_run(const RunCompletion& completion)
      -> Result<TaskStatus>;
  [[nodiscard]] auto get_runs(TaskId id) -> Result<std::vector<RunRecord>>;

  // Workers
  // Upserts the worker row and returns the status an operator may have set.
  [[nodiscard]] auto heartbeat(const WorkerInfo& worker, TimePoint now)
      -> Result<WorkerStatus>;
  [[nodiscard]] auto remove_worker(std::string_view worker_name)
      -> Result<void>;
  [[nodiscard]] auto set_worker_status(std::string_view worker_name,
                                       WorkerStatus status) -> Result<void>;
  [[nodiscard]] auto get_worker(std::string_view worker_name)
      -> Result<WorkerInfo>;
  [[nodiscard]] auto list_workers() -> Result<std::vector<WorkerInfo>>;

  // Housekeeping; both are idempotent.
  [[nodiscard]] auto reclaim_stale(TimePoint now,
                                   std::chrono::milliseconds stale_after,
                                   std::string_view self_name)
      -> Result<ReclaimResult>;
  // QUEUED tasks whose next fire is past stop_time, or whose stop_time is
  // before `cutoff`, become EXPIRED.
  [[nodiscard]] auto expire_tasks(TimePoint cutoff) -> Result<int>;

  // Dependencies
  [[nodiscard]] auto add_dependencies(std::string_view job_name,
                                      std::span<const DependencyEdge> edges)
      -> Result<void>;
  [[nodiscard]] auto dependency_snapshot() -> Result<DependencySnapshot>;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto changes() const -> int;

  [[nodiscard]] auto write_task(const Task& task, bool replace)
      -> Result<TaskId>;
  [[nodiscard]] auto add_dependencies_locked(
      std::string_view job_name, std::span<const DependencyEdge> edges)
      -> Result<void>;
  [[nodiscard]] auto load_latest_run(Task& task) -> Result<void>;
  [[nodiscard]] auto close_run(const RunCompletion& completion,
                               RunStatus status) -> Result<void>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::chrono::milliseconds busy_timeout_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace cronwork
