#include "cronwork/cli/commands.hpp"
#include "cronwork/scheduler/client.hpp"
#include "cronwork/storage/state_strings.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <chrono>
#include <format>
#include <print>

namespace cronwork::cli {

namespace {

auto print_task(const Task& t, bool with_output) -> void {
  std::println("Task:      {} ({})", t.id, t.uuid);
  if (!t.task_name.empty()) {
    std::println("Name:      {}", t.task_name);
  }
  std::println("Function:  {}", t.function_ref);
  std::println("Group:     {}", t.group_name);
  std::println("Status:    {}{}", task_status_name(t.status),
               t.enabled ? "" : " (disabled)");
  if (!t.cron.empty()) {
    std::println("Cron:      {}", t.cron);
  } else if (t.period.count() > 0) {
    std::println("Period:    {}s{}", t.period.count(),
                 t.prevent_drift ? " (no drift)" : "");
  }
  std::println("Next run:  {}", format_time(t.next_run_time));
  std::println("Last run:  {}", format_time(t.last_run_time));
  if (t.stop_time) {
    std::println("Stop time: {}", format_time(*t.stop_time));
  }
  std::println("Runs:      {} ({} failed)", t.times_run, t.times_failed);
  std::println("Repeats:   {}", t.repeats == 0 ? std::string("unlimited")
                                                : std::to_string(t.repeats));
  std::println("Retries:   {}", t.retry_failed);
  if (!t.assigned_worker.empty()) {
    std::println("Worker:    {}", t.assigned_worker);
  }
  if (with_output) {
    if (!t.result.is_null()) {
      std::println("Result:    {}", t.result.dump());
    }
    if (!t.output.empty()) {
      std::println("Output:");
      std::print("{}", t.output);
      if (t.output.back() != '\n') {
        std::println("");
      }
    }
  }
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
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

  TaskQuery query = TaskFilter{};
  if (opts.id) {
    query = *opts.id;
  } else if (!opts.uuid.empty()) {
    query = TaskUuid{opts.uuid};
  } else {
    TaskFilter filter;
    if (!opts.status.empty()) {
      filter.status = parse_task_status(opts.status);
      if (!filter.status) {
        std::println(stderr, "Error: Unknown status: {}", opts.status);
        return 1;
      }
    }
    filter.group_name = opts.group;
    query = std::move(filter);
  }
  bool single = !std::holds_alternative<TaskFilter>(query);

  auto tasks = client.task_status(query, opts.output || single);
  if (!tasks) {
    std::println(stderr, "Error: {}", tasks.error().message());
    return 1;
  }

  if (tasks->empty()) {
    if (single) {
      std::println(stderr, "Error: Task not found");
      return 1;
    }
    std::println("No tasks found.");
    return 0;
  }

  if (single) {
    print_task(tasks->front(), true);
    return 0;
  }

  std::println("{:<6} {:<20} {:<10} {:<10} {:<21} {:<6} {:<6}", "ID", "NAME",
               "GROUP", "STATUS", "NEXT_RUN", "RUNS", "FAILED");
  for (const auto& t : *tasks) {
    std::println("{:<6} {:<20} {:<10} {:<10} {:<21} {:<6} {:<6}", t.id,
                 t.task_name.empty() ? t.function_ref : t.task_name,
                 t.group_name, task_status_name(t.status),
                 format_time(t.next_run_time), t.times_run, t.times_failed);
    if (opts.output && !t.output.empty()) {
      std::println("       output: {}", t.output);
    }
  }
  return 0;
}

}  // namespace cronwork::cli
