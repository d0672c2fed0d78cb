#pragma once

#include "cronwork/util/id.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace cronwork {

// Marker that discards all output written before it.
inline constexpr std::string_view kClearOutputMarker = "!clear!";

// Handed to a task function inside the child process. Everything written
// through it (or to stdout/stderr) becomes the run's output.
class TaskContext {
public:
  TaskContext() = default;
  TaskContext(TaskId task_id, std::string uuid, std::string task_name,
              RunId run_id, std::string worker_name)
      : task_id_(task_id),
        uuid_(std::move(uuid)),
        task_name_(std::move(task_name)),
        run_id_(run_id),
        worker_name_(std::move(worker_name)) {
  }

  [[nodiscard]] auto task_id() const noexcept -> TaskId {
    return task_id_;
  }
  [[nodiscard]] auto uuid() const noexcept -> const std::string& {
    return uuid_;
  }
  [[nodiscard]] auto task_name() const noexcept -> const std::string& {
    return task_name_;
  }
  [[nodiscard]] auto run_id() const noexcept -> RunId {
    return run_id_;
  }
  [[nodiscard]] auto worker_name() const noexcept -> const std::string& {
    return worker_name_;
  }

  // Writes one line of output and flushes it to the parent.
  auto progress(std::string_view message) const -> void;
  // Replaces, rather than appends to, the output seen so far.
  auto clear_output() const -> void;

private:
  TaskId task_id_{kInvalidTaskId};
  std::string uuid_;
  std::string task_name_;
  RunId run_id_{kInvalidRunId};
  std::string worker_name_;
};

}  // namespace cronwork
