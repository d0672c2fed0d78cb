#include "cronwork/cli/commands.hpp"
#include "cronwork/scheduler/client.hpp"
#include "cronwork/storage/state_strings.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <chrono>
#include <print>

namespace cronwork::cli {

auto cmd_stop(const StopOptions& opts) -> int {
  if (!opts.id && opts.uuid.empty()) {
    std::println(stderr, "Error: stop requires --id or --uuid");
    return 1;
  }

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
  TaskClient client(registry);

  auto status = opts.id ? client.stop_task(*opts.id)
                        : client.stop_task(TaskUuid{opts.uuid});
  if (!status) {
    std::println(stderr, "Error: {}", status.error().message());
    return 1;
  }

  if (*status == TaskStatus::Stopped) {
    std::println("Task stopped.");
  } else {
    std::println("Task already finished: {}", task_status_name(*status));
  }
  return 0;
}

}  // namespace cronwork::cli
