#pragma once

#include <string>
#include <vector>

namespace cronwork {

struct StorageConfig {
  std::string db_file{"cronwork.db"};
  int busy_timeout_ms{5000};
};

struct WorkerConfig {
  std::string name;  // empty = host#pid
  std::vector<std::string> groups{"main"};
  std::string pid_file;
  int tick_interval_ms{1000};
  int heartbeat_interval_ms{3000};
  int stale_after_ms{30000};
  int cancel_check_interval_ms{1000};
  int max_empty_runs{0};
};

struct RetryConfig {
  std::string mode{"immediate"};
  int delay_sec{0};
};

struct LogConfig {
  std::string level{"info"};
  std::string file;
};

struct SystemConfig {
  StorageConfig storage;
  WorkerConfig worker;
  RetryConfig retry;
  LogConfig log;
};

}  // namespace cronwork
