#include "cronwork/util/daemon.hpp"

#include "cronwork/util/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <format>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace cronwork {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  int null_fd = open("/dev/null", O_RDWR);
  if (null_fd < 0) return false;
  dup2(null_fd, STDIN_FILENO);
  dup2(null_fd, STDOUT_FILENO);
  dup2(null_fd, STDERR_FILENO);
  if (null_fd > STDERR_FILENO) close(null_fd);
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}

auto write_pid_file(std::string_view path) -> Result<void> {
  std::string p{path};
  std::FILE* f = std::fopen(p.c_str(), "w");
  if (!f) {
    log::error("Failed to write pid file {}: {}", path, strerror(errno));
    return fail(Error::FileOpenFailed);
  }
  auto line = std::format("{}\n", getpid());
  bool written = std::fputs(line.c_str(), f) >= 0;
  if (std::fclose(f) != 0 || !written) {
    log::error("Failed to write pid file {}", path);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

}  // namespace cronwork
