#pragma once

#include "cronwork/storage/task.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace cronwork {

namespace detail {

constexpr std::array<std::string_view, 8> kTaskStatusNames = {
    "queued",  "assigned", "running", "completed",
    "failed",  "timeout",  "stopped", "expired",
};

constexpr std::array<std::string_view, 5> kRunStatusNames = {
    "running", "completed", "failed", "timeout", "stopped",
};

constexpr std::array<std::string_view, 3> kWorkerStatusNames = {
    "active",
    "disabled",
    "terminating",
};

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr auto parse_name(
    const std::array<std::string_view, N>& names, std::string_view name)
    -> std::optional<Enum> {
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<Enum>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size()
             ? detail::kTaskStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  return detail::parse_name<TaskStatus>(detail::kTaskStatusNames, name);
}

[[nodiscard]] inline auto run_status_name(RunStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kRunStatusNames.size()
             ? detail::kRunStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_run_status(std::string_view name) noexcept
    -> std::optional<RunStatus> {
  return detail::parse_name<RunStatus>(detail::kRunStatusNames, name);
}

[[nodiscard]] inline auto worker_status_name(WorkerStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kWorkerStatusNames.size()
             ? detail::kWorkerStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_worker_status(std::string_view name) noexcept
    -> std::optional<WorkerStatus> {
  return detail::parse_name<WorkerStatus>(detail::kWorkerStatusNames, name);
}

}  // namespace cronwork
