#pragma once

#include "cronwork/config/system_config.hpp"
#include "cronwork/util/id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cronwork::cli {

// -c/--config and --db, accepted by every command. --db wins over the
// config file.
struct CommonOptions {
  std::string config_file;
  std::string db_file;
};

struct WorkerRunOptions {
  CommonOptions common;
  std::string name;
  std::vector<std::string> groups;
  bool daemon{false};
};

struct QueueOptions {
  CommonOptions common;
  std::string function;
  std::string args{"[]"};
  std::string kwargs{"{}"};
  std::string name;
  std::string group;
  std::string uuid;
  std::string cron;
  std::int64_t period_sec{0};
  std::optional<std::int64_t> start_epoch;
  std::optional<std::int64_t> stop_epoch;
  int repeats{1};
  std::int64_t timeout_sec{60};
  int retry_failed{0};
  bool prevent_drift{false};
  bool immediate{false};
  std::int64_t sync_output_sec{0};
  std::vector<TaskId> depends_on;
  std::string job;
  bool overwrite{false};
};

struct StatusOptions {
  CommonOptions common;
  std::optional<TaskId> id;
  std::string uuid;
  std::string status;
  std::string group;
  bool output{false};
};

struct StopOptions {
  CommonOptions common;
  std::optional<TaskId> id;
  std::string uuid;
};

struct WorkersOptions {
  CommonOptions common;
  std::string disable;
  std::string resume;
  std::string terminate;
};

struct ValidateOptions {
  std::string cron;
  int count{5};
};

[[nodiscard]] auto cmd_worker(const WorkerRunOptions& opts) -> int;
[[nodiscard]] auto cmd_queue(const QueueOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_stop(const StopOptions& opts) -> int;
[[nodiscard]] auto cmd_workers(const WorkersOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;

// Loads the config file (or defaults), applies --db and sets up logging.
// Prints the reason and returns nullopt on failure.
[[nodiscard]] auto load_settings(const CommonOptions& opts)
    -> std::optional<SystemConfig>;

}  // namespace cronwork::cli
