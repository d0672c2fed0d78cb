#include "cronwork/cli/commands.hpp"
#include "cronwork/storage/state_strings.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <chrono>
#include <print>

namespace cronwork::cli {

namespace {

auto join(const std::vector<std::string>& items) -> std::string {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += ",";
    }
    out += item;
  }
  return out;
}

}  // namespace

auto cmd_workers(const WorkersOptions& opts) -> int {
  auto config = load_settings(opts.common);
  if (!config) {
    return 1;
  }

  TaskRegistry registry(
      config->storage.db_file,
      std::chrono::milliseconds(config->storage.busy_timeout_ms));
  if (auto r = registry.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  std::string target;
  WorkerStatus status = WorkerStatus::Active;
  if (!opts.disable.empty()) {
    target = opts.disable;
    status = WorkerStatus::Disabled;
  } else if (!opts.resume.empty()) {
    target = opts.resume;
  } else if (!opts.terminate.empty()) {
    target = opts.terminate;
    status = WorkerStatus::Terminating;
  }

  if (!target.empty()) {
    if (auto r = registry.set_worker_status(target, status); !r) {
      std::println(stderr, "Error: Worker {}: {}", target,
                   r.error().message());
      return 1;
    }
    std::println("Worker {} set to {}", target, worker_status_name(status));
    return 0;
  }

  auto workers = registry.list_workers();
  if (!workers) {
    std::println(stderr, "Error: {}", workers.error().message());
    return 1;
  }
  if (workers->empty()) {
    std::println("No workers registered.");
    return 0;
  }

  std::println("{:<32} {:<12} {:<16} {:<21}", "WORKER", "STATUS", "GROUPS",
               "LAST_HEARTBEAT");
  for (const auto& w : *workers) {
    std::println("{:<32} {:<12} {:<16} {:<21}", w.worker_name,
                 worker_status_name(w.status), join(w.group_names),
                 format_time(w.last_heartbeat));
  }
  return 0;
}

}  // namespace cronwork::cli
