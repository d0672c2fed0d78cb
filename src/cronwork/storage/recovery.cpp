#include "cronwork/storage/recovery.hpp"

#include "cronwork/util/log.hpp"

namespace cronwork {

Recovery::Recovery(TaskRegistry& registry) : registry_(registry) {
}

auto Recovery::recover(TimePoint now, std::chrono::milliseconds stale_after,
                       std::chrono::milliseconds expiry_grace,
                       std::string_view self_name) -> Result<RecoveryResult> {
  RecoveryResult result;

  auto reclaimed = registry_.reclaim_stale(now, stale_after, self_name);
  if (!reclaimed) {
    log::warn("Stale worker reclaim failed: {}", reclaimed.error().message());
    return fail(reclaimed.error());
  }
  result.workers_removed = reclaimed->workers_removed;
  result.tasks_requeued = reclaimed->tasks_requeued;
  result.runs_failed = reclaimed->runs_failed;

  auto expired = registry_.expire_tasks(now - expiry_grace);
  if (!expired) {
    log::warn("Task expiry failed: {}", expired.error().message());
    return fail(expired.error());
  }
  result.tasks_expired = *expired;
  if (result.tasks_expired > 0) {
    log::info("Expired {} tasks past their stop time", result.tasks_expired);
  }

  return ok(result);
}

}  // namespace cronwork
