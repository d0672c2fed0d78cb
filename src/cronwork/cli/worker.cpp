#include "cronwork/cli/commands.hpp"
#include "cronwork/config/config.hpp"
#include "cronwork/executor/function_registry.hpp"
#include "cronwork/scheduler/worker.hpp"
#include "cronwork/storage/task_registry.hpp"
#include "cronwork/util/daemon.hpp"
#include "cronwork/util/log.hpp"

#include <chrono>
#include <print>

namespace cronwork::cli {

auto cmd_worker(const WorkerRunOptions& opts) -> int {
  auto config = load_settings(opts.common);
  if (!config) {
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }
  setup_signal_handlers();

  if (!config->worker.pid_file.empty()) {
    if (auto r = write_pid_file(config->worker.pid_file); !r) {
      return 1;
    }
  }

  TaskRegistry registry(
      config->storage.db_file,
      std::chrono::milliseconds(config->storage.busy_timeout_ms));
  if (auto r = registry.open(); !r) {
    log::error("Failed to open database {}: {}", config->storage.db_file,
               r.error().message());
    return 1;
  }

  using std::chrono::milliseconds;
  const auto& w = config->worker;
  WorkerOptions options{
      .name = opts.name.empty() ? w.name : opts.name,
      .groups = opts.groups.empty() ? w.groups : opts.groups,
      .tick_interval = milliseconds(w.tick_interval_ms),
      .heartbeat_interval = milliseconds(w.heartbeat_interval_ms),
      .stale_after = milliseconds(w.stale_after_ms),
      .cancel_check_interval = milliseconds(w.cancel_check_interval_ms),
      .max_empty_runs = w.max_empty_runs,
      .retry = retry_policy_from(config->retry)};

  FunctionRegistry functions;
  Worker worker(registry, functions, std::move(options));
  log::set_tag(worker.name());

  worker.run(g_shutdown_requested);

  if (g_shutdown_requested.load(std::memory_order_acquire)) {
    log::info("Received shutdown signal, stopped.");
  }
  registry.close();
  return 0;
}

}  // namespace cronwork::cli
