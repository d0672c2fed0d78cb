#include "cronwork/scheduler/client.hpp"

#include "cronwork/scheduler/cron.hpp"
#include "cronwork/scheduler/reschedule.hpp"
#include "cronwork/util/log.hpp"

#include <format>

namespace cronwork {

TaskClient::TaskClient(TaskRegistry& registry,
                       const FunctionRegistry* functions, ClockFn clock)
    : registry_(registry), functions_(functions), clock_(std::move(clock)) {
}

auto TaskClient::validate(std::string_view function_ref,
                          const nlohmann::json& args,
                          const nlohmann::json& kwargs,
                          const TaskOptions& options) const
    -> std::vector<std::string> {
  std::vector<std::string> errors;

  if (function_ref.empty()) {
    errors.emplace_back("function name is required");
  } else if (functions_ && !functions_->contains(function_ref)) {
    errors.push_back(std::format("unknown function '{}'", function_ref));
  }
  if (!args.is_array()) {
    errors.emplace_back("args must be a JSON array");
  }
  if (!kwargs.is_object()) {
    errors.emplace_back("kwargs must be a JSON object");
  }
  if (options.group_name.empty()) {
    errors.emplace_back("group name must not be empty");
  }

  if (!options.cron.empty()) {
    if (auto why = CronExpr::explain(options.cron); !why.empty()) {
      errors.push_back(std::format("invalid cron expression: {}", why));
    }
    if (options.period.count() != 0) {
      errors.emplace_back("cron and period are mutually exclusive");
    }
  }
  if (options.period.count() < 0) {
    errors.emplace_back("period must be positive");
  }
  if (options.timeout.count() <= 0) {
    errors.emplace_back("timeout must be positive");
  }
  if (options.repeats < 0) {
    errors.emplace_back("repeats must not be negative");
  }
  if (options.retry_failed < 0) {
    errors.emplace_back("retry_failed must not be negative");
  }
  if (options.sync_output_interval.count() < 0) {
    errors.emplace_back("sync_output must not be negative");
  }
  if (options.stop_time && options.start_time &&
      *options.stop_time <= *options.start_time) {
    errors.emplace_back("stop_time must be after start_time");
  }
  for (auto dep : options.depends_on) {
    if (dep == kInvalidTaskId) {
      errors.emplace_back("depends_on contains an invalid task id");
      break;
    }
  }
  return errors;
}

auto TaskClient::queue_task(std::string_view function_ref, nlohmann::json args,
                            nlohmann::json kwargs, const TaskOptions& options)
    -> Result<QueueResult> {
  QueueResult out;
  out.errors = validate(function_ref, args, kwargs, options);
  if (!out.ok()) {
    return out;
  }

  auto now = clock_();
  Task task;
  task.uuid = options.uuid.empty() ? generate_uuid() : options.uuid;
  task.task_name = options.task_name;
  task.group_name = options.group_name;
  task.function_ref = std::string(function_ref);
  task.args = std::move(args);
  task.kwargs = std::move(kwargs);
  task.cron = options.cron;
  task.start_time = options.start_time.value_or(now);
  task.period = options.period;
  task.stop_time = options.stop_time;
  task.repeats = options.repeats;
  task.timeout = options.timeout;
  task.retry_failed = options.retry_failed;
  task.prevent_drift = options.prevent_drift;
  task.immediate = options.immediate;
  task.sync_output_interval = options.sync_output_interval;
  task.enabled = options.enabled;
  task.status = TaskStatus::Queued;
  out.uuid = task.uuid;

  auto first = first_fire_time(task, now);
  if (!first) {
    out.errors.push_back(
        std::format("cannot compute first fire time: {}", first.error().message()));
    return out;
  }
  task.next_run_time = *first;
  if (task.stop_time && task.next_run_time > *task.stop_time) {
    out.errors.emplace_back("first fire time is after stop_time");
    return out;
  }

  auto id = options.overwrite
                ? registry_.replace_task(task, options.job_name,
                                         options.depends_on)
                : registry_.insert_task(task, options.job_name,
                                        options.depends_on);
  if (id) {
    out.id = *id;
    log::info("Queued task {} ({}) function={} next={}", out.id, out.uuid,
              task.function_ref, format_time(task.next_run_time));
    return out;
  }

  // Storage rejections of the definition are reported like validation errors.
  const auto& ec = id.error();
  if (ec == make_error_code(Error::AlreadyExists)) {
    out.errors.push_back(
        std::format("task with uuid {} already exists", task.uuid));
  } else if (ec == make_error_code(Error::NotFound)) {
    out.errors.push_back(options.overwrite
                             ? std::format("no task with uuid {}", task.uuid)
                             : std::string("depends_on names an unknown task"));
  } else if (ec == make_error_code(Error::TaskRunning)) {
    out.errors.push_back(std::format(
        "task with uuid {} is running, not overwritten", task.uuid));
  } else if (ec == make_error_code(Error::CycleDetected)) {
    out.errors.emplace_back("dependencies would create a cycle");
  } else {
    return std::unexpected(ec);
  }
  return out;
}

auto TaskClient::add_dependencies(std::string_view job_name,
                                  std::span<const DependencyEdge> edges)
    -> Result<void> {
  return registry_.add_dependencies(job_name, edges);
}

auto TaskClient::task_status(const TaskQuery& query, bool include_output)
    -> Result<std::vector<Task>> {
  return registry_.find_tasks(query, include_output);
}

auto TaskClient::stop_task(TaskId id) -> Result<TaskStatus> {
  return registry_.stop_task(id);
}

auto TaskClient::stop_task(const TaskUuid& uuid) -> Result<TaskStatus> {
  return registry_.stop_task(uuid);
}

}  // namespace cronwork
