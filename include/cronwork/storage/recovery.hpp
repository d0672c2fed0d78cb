#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/storage/task_registry.hpp"

#include <chrono>
#include <string_view>

namespace cronwork {

struct RecoveryResult {
  int workers_removed{0};
  int tasks_requeued{0};
  int runs_failed{0};
  int tasks_expired{0};
};

// Housekeeping run by every active worker on each heartbeat. Safe to run
// concurrently from several workers.
class Recovery {
public:
  explicit Recovery(TaskRegistry& registry);

  // Removes workers silent for longer than `stale_after`, re-queues their
  // tasks, then expires queued tasks past their stop time. A fire landing
  // exactly on stop_time stays claimable for `expiry_grace`.
  [[nodiscard]] auto recover(TimePoint now,
                             std::chrono::milliseconds stale_after,
                             std::chrono::milliseconds expiry_grace,
                             std::string_view self_name)
      -> Result<RecoveryResult>;

private:
  TaskRegistry& registry_;
};

}  // namespace cronwork
