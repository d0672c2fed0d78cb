#include "cronwork/scheduler/worker.hpp"

#include "cronwork/storage/state_strings.hpp"
#include "cronwork/util/log.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <thread>

#include <unistd.h>

namespace cronwork {

namespace {

using steady = std::chrono::steady_clock;

inline constexpr std::chrono::milliseconds kSleepSlice{100};

auto join_groups(const std::vector<std::string>& groups) -> std::string {
  std::string out;
  for (const auto& g : groups) {
    if (!out.empty()) {
      out += ", ";
    }
    out += g;
  }
  return out;
}

}  // namespace

auto default_worker_name() -> std::string {
  std::array<char, 256> host{};
  if (gethostname(host.data(), host.size() - 1) != 0) {
    return std::format("worker#{}", getpid());
  }
  return std::format("{}#{}", host.data(), getpid());
}

Worker::Worker(TaskRegistry& registry, const FunctionRegistry& functions,
               WorkerOptions options, ClockFn clock)
    : registry_(registry),
      functions_(functions),
      options_(std::move(options)),
      clock_(std::move(clock)),
      recovery_(registry) {
  if (options_.name.empty()) {
    options_.name = default_worker_name();
  }
  if (options_.groups.empty()) {
    options_.groups.emplace_back(kDefaultGroup);
  }
}

auto Worker::heartbeat_due() const -> bool {
  return !last_heartbeat_ ||
         steady::now() - *last_heartbeat_ >= options_.heartbeat_interval;
}

auto Worker::heartbeat() -> Result<WorkerStatus> {
  auto now = clock_();
  WorkerInfo info{.worker_name = options_.name, .group_names = options_.groups};

  auto status = registry_.heartbeat(info, now);
  if (!status) {
    return std::unexpected(status.error());
  }
  last_heartbeat_ = steady::now();

  if (*status != status_) {
    log::info("Worker {} is now {}", options_.name, worker_status_name(*status));
    status_ = *status;
  }

  if (status_ == WorkerStatus::Active) {
    if (auto r = recovery_.recover(now, options_.stale_after,
                                   options_.tick_interval, options_.name);
        !r) {
      log::warn("Housekeeping failed: {}", r.error().message());
    }
  }
  return status_;
}

auto Worker::run_once() -> Result<TickOutcome> {
  if (heartbeat_due()) {
    if (auto r = heartbeat(); !r) {
      return std::unexpected(r.error());
    }
  }

  if (status_ == WorkerStatus::Terminating) {
    return TickOutcome::Terminating;
  }
  if (status_ == WorkerStatus::Disabled) {
    return TickOutcome::Paused;
  }

  // One execution slot: an unrecorded run still occupies it.
  if (auto r = flush_pending(); !r) {
    return std::unexpected(r.error());
  }

  auto claimed = claim_next(clock_());
  if (!claimed) {
    return std::unexpected(claimed.error());
  }
  if (!*claimed) {
    return TickOutcome::Idle;
  }

  execute(**claimed);
  return TickOutcome::Executed;
}

auto Worker::claim_next(TimePoint now) -> Result<std::optional<Task>> {
  auto due = registry_.due_tasks(now, options_.groups, options_.poll_limit);
  if (!due) {
    return std::unexpected(due.error());
  }
  if (due->empty()) {
    return std::optional<Task>{};
  }

  auto snapshot = registry_.dependency_snapshot();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }

  for (auto& task : *due) {
    if (!snapshot->ready(task.id)) {
      log::trace("Task {} waits on dependencies", task.id);
      continue;
    }

    auto r = registry_.claim(task.id, options_.name);
    if (r) {
      task.status = TaskStatus::Assigned;
      task.assigned_worker = options_.name;
      return std::optional<Task>{std::move(task)};
    }
    if (r.error() == make_error_code(Error::ClaimLost)) {
      log::debug("Lost claim on task {}", task.id);
      continue;
    }
    return std::unexpected(r.error());
  }
  return std::optional<Task>{};
}

auto Worker::execute(const Task& task) -> void {
  auto start = clock_();
  auto run_id = registry_.start_run(task.id, options_.name, start);
  if (!run_id) {
    if (run_id.error() == make_error_code(Error::ClaimLost)) {
      log::debug("Task {} was taken back before it started", task.id);
      return;
    }
    log::warn("Failed to start task {}: {}", task.id,
              run_id.error().message());
    if (auto r = release(task.id); !r) {
      pending_release_ = task.id;
    }
    return;
  }

  log::info("Running task {} ({}) function={} run={}", task.id,
            task.task_name.empty() ? task.uuid : task.task_name,
            task.function_ref, *run_id);

  ChildResult child = run_child(task, *run_id);
  auto finish = clock_();

  RunCompletion completion{
      .task_id = task.id,
      .run_id = *run_id,
      .worker_name = options_.name,
      .run_status = run_status_for(child.outcome),
      .finished = finish,
      .output = std::move(child.output),
      .result = std::move(child.result),
      .traceback = std::move(child.traceback),
      .update = decide_next(task, child.outcome, finish, options_.retry)};

  if (auto r = record(completion); !r) {
    log::error("Failed to record run {} of task {}: {}, retrying next tick",
               *run_id, task.id, r.error().message());
    pending_completion_ = std::move(completion);
  }
}

auto Worker::record(const RunCompletion& completion) -> Result<void> {
  auto final_status = registry_.complete_run(completion);
  if (!final_status) {
    if (final_status.error() == make_error_code(Error::ClaimLost)) {
      log::debug("Task {} was reclaimed while running", completion.task_id);
      return ok();
    }
    if (final_status.error() == make_error_code(Error::NotFound)) {
      log::warn("Task {} vanished before run {} was recorded",
                completion.task_id, completion.run_id);
      return ok();
    }
    return std::unexpected(final_status.error());
  }

  log::info("Task {} run {} finished {} -> {}", completion.task_id,
            completion.run_id, run_status_name(completion.run_status),
            task_status_name(*final_status));
  return ok();
}

auto Worker::release(TaskId id) -> Result<void> {
  auto r = registry_.release_claim(id, options_.name);
  if (r) {
    log::debug("Released claim on task {}", id);
    return ok();
  }
  if (r.error() == make_error_code(Error::ClaimLost)) {
    log::debug("Claim on task {} was already gone", id);
    return ok();
  }
  log::warn("Failed to release task {}: {}", id, r.error().message());
  return r;
}

auto Worker::flush_pending() -> Result<void> {
  if (pending_release_) {
    if (auto r = release(*pending_release_); !r) {
      return r;
    }
    pending_release_.reset();
  }
  if (pending_completion_) {
    if (auto r = record(*pending_completion_); !r) {
      return r;
    }
    pending_completion_.reset();
  }
  return ok();
}

auto Worker::run_child(const Task& task, RunId run_id) -> ChildResult {
  const auto* fn = functions_.find(task.function_ref);
  if (!fn) {
    return ChildResult{.outcome = RunOutcome::Failed,
                       .traceback = std::format(
                           "{} '{}'",
                           make_error_code(Error::UnknownFunction).message(),
                           task.function_ref)};
  }

  TaskContext ctx(task.id, task.uuid, task.task_name, run_id, options_.name);
  auto child = ChildProcess::spawn(*fn, std::move(ctx), task.args, task.kwargs);
  if (!child) {
    return ChildResult{.outcome = RunOutcome::Failed,
                       .traceback = child.error().message()};
  }

  auto last_cancel_check = steady::now();
  auto last_sync = steady::now();

  WaitOptions wait_options{
      .timeout = task.timeout,
      .tick_interval = std::min({options_.tick_interval,
                                 options_.heartbeat_interval,
                                 options_.cancel_check_interval}),
      .on_tick = [&](std::string_view output) -> bool {
        auto now = steady::now();

        if (heartbeat_due()) {
          if (auto r = heartbeat(); !r) {
            log::warn("Heartbeat failed while running task {}: {}", task.id,
                      r.error().message());
          }
        }

        if (task.sync_output_interval.count() > 0 &&
            now - last_sync >= task.sync_output_interval) {
          last_sync = now;
          if (auto r = registry_.sync_run_output(run_id, output); !r) {
            log::warn("Output sync for run {} failed: {}", run_id,
                      r.error().message());
          }
        }

        if (now - last_cancel_check >= options_.cancel_check_interval) {
          last_cancel_check = now;
          auto status = registry_.task_status_of(task.id);
          if (status && *status == TaskStatus::Stopped) {
            log::info("Task {} was stopped, killing child {}", task.id,
                      child->pid());
            return false;
          }
        }
        return true;
      }};

  return child->wait(wait_options);
}

auto Worker::sleep_tick(const std::atomic<bool>& stop) const -> void {
  auto deadline = steady::now() + options_.tick_interval;
  while (!stop.load(std::memory_order_acquire)) {
    auto now = steady::now();
    if (now >= deadline) {
      return;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, kSleepSlice));
  }
}

auto Worker::run(const std::atomic<bool>& stop) -> void {
  log::info("Worker {} started, groups [{}]", options_.name,
            join_groups(options_.groups));

  while (!stop.load(std::memory_order_acquire)) {
    auto outcome = run_once();
    if (!outcome) {
      log::warn("Worker tick failed: {}", outcome.error().message());
      sleep_tick(stop);
      continue;
    }

    if (*outcome == TickOutcome::Terminating) {
      log::info("Worker {} terminating on request", options_.name);
      break;
    }
    if (*outcome == TickOutcome::Executed) {
      empty_runs_ = 0;
      continue;
    }
    if (*outcome == TickOutcome::Idle) {
      ++empty_runs_;
      if (options_.max_empty_runs > 0 &&
          empty_runs_ >= options_.max_empty_runs) {
        log::info("Worker {} exiting after {} empty polls", options_.name,
                  empty_runs_);
        break;
      }
    }
    sleep_tick(stop);
  }

  if (auto r = flush_pending(); !r) {
    log::warn("Leaving unrecorded work to housekeeping: {}",
              r.error().message());
  }
  shutdown();
}

auto Worker::shutdown() -> void {
  if (auto r = registry_.remove_worker(options_.name); !r) {
    log::warn("Failed to remove worker {}: {}", options_.name,
              r.error().message());
    return;
  }
  log::info("Worker {} stopped", options_.name);
}

}  // namespace cronwork
