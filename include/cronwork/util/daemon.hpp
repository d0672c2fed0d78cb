#pragma once

#include "cronwork/core/error.hpp"

#include <atomic>
#include <string_view>

namespace cronwork {

extern std::atomic<bool> g_shutdown_requested;

// Detaches from the terminal. Standard streams point at /dev/null afterwards
// so later pipes never land on fds 0-2.
[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();
[[nodiscard]] auto write_pid_file(std::string_view path) -> Result<void>;

}  // namespace cronwork
