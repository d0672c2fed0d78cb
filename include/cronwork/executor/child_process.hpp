#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/executor/function_registry.hpp"
#include "cronwork/executor/task_context.hpp"
#include "cronwork/scheduler/reschedule.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace cronwork {

inline constexpr std::size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;

struct ChildResult {
  RunOutcome outcome{RunOutcome::Failed};
  std::string output;
  std::string result;     // JSON text of the returned value
  std::string traceback;  // why the run failed
  int exit_code{-1};
};

struct WaitOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds tick_interval{std::chrono::seconds(1)};
  // Called every tick with the output so far; returning false cancels.
  std::function<bool(std::string_view output)> on_tick;
};

// waitpid() status as a shell reports it: the exit status, or 128 + signal.
[[nodiscard]] auto get_exit_code(int status) -> int;

// One task function running in a forked child that leads its own process
// group. The destructor kills and reaps a child that was never waited for.
class ChildProcess {
public:
  [[nodiscard]] static auto spawn(const TaskFunction& fn, TaskContext ctx,
                                  const nlohmann::json& args,
                                  const nlohmann::json& kwargs)
      -> Result<ChildProcess>;

  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ~ChildProcess();

  // Blocks until the child exits, the timeout passes (SIGKILL to the group,
  // TimedOut) or on_tick asks to cancel (SIGKILL, Cancelled).
  [[nodiscard]] auto wait(const WaitOptions& options) -> ChildResult;

  auto kill() -> void;

  [[nodiscard]] auto pid() const noexcept -> pid_t {
    return pid_;
  }

private:
  ChildProcess(pid_t pid, int output_fd, int result_fd) noexcept;

  auto drain_output() -> bool;
  auto drain_result() -> bool;
  auto append_output(std::string_view chunk) -> void;
  [[nodiscard]] auto reap(bool block) -> bool;
  auto close_fds() noexcept -> void;

  pid_t pid_{-1};
  int output_fd_{-1};
  int result_fd_{-1};
  int pidfd_{-1};
  bool reaped_{false};
  int status_{0};
  std::string output_;
  std::string result_;
};

}  // namespace cronwork
