#include "cronwork/cli/commands.hpp"
#include "cronwork/scheduler/client.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace cronwork::cli {

namespace {
auto parse_json(std::string_view what, const std::string& text)
    -> std::optional<nlohmann::json> {
  auto value = nlohmann::json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    std::println(stderr, "Error: --{} is not valid JSON: {}", what, text);
    return std::nullopt;
  }
  return value;
}
}  // namespace

auto cmd_queue(const QueueOptions& opts) -> int {
  auto config = load_settings(opts.common);
  if (!config) {
    return 1;
  }

  auto args = parse_json("args", opts.args);
  auto kwargs = parse_json("kwargs", opts.kwargs);
  if (!args || !kwargs) {
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

  TaskOptions task;
  task.task_name = opts.name;
  if (!opts.group.empty()) {
    task.group_name = opts.group;
  }
  task.uuid = opts.uuid;
  task.cron = opts.cron;
  task.period = std::chrono::seconds(opts.period_sec);
  if (opts.start_epoch) {
    task.start_time = from_epoch_seconds(*opts.start_epoch);
  }
  if (opts.stop_epoch) {
    task.stop_time = from_epoch_seconds(*opts.stop_epoch);
  }
  task.repeats = opts.repeats;
  task.timeout = std::chrono::seconds(opts.timeout_sec);
  task.retry_failed = opts.retry_failed;
  task.prevent_drift = opts.prevent_drift;
  task.immediate = opts.immediate;
  task.sync_output_interval = std::chrono::seconds(opts.sync_output_sec);
  task.depends_on = opts.depends_on;
  task.job_name = opts.job;
  task.overwrite = opts.overwrite;

  // Functions are resolved by name on the worker side.
  TaskClient client(registry);

  auto result = client.queue_task(opts.function, std::move(*args),
                                  std::move(*kwargs), task);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  if (!result->ok()) {
    for (const auto& e : result->errors) {
      std::println(stderr, "Error: {}", e);
    }
    return 1;
  }

  std::println("Queued task {} ({})", result->id, result->uuid);
  return 0;
}

}  // namespace cronwork::cli
