#include "cronwork/executor/child_process.hpp"

#include "cronwork/util/log.hpp"

#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace cronwork {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr std::size_t INITIAL_OUTPUT_RESERVE = 8192;
// Without a pidfd the loop falls back to polling waitpid.
inline constexpr std::chrono::milliseconds kReapPollInterval{50};

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}

// The read end is non-blocking for the poll loop; the write end stays
// blocking so the child never loses output to EAGAIN.
auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  int flags = fcntl(fds[0], F_GETFL);
  if (flags < 0 || fcntl(fds[0], F_SETFL, flags | O_NONBLOCK) < 0) {
    close(fds[0]);
    close(fds[1]);
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

auto write_all(int fd, std::string_view data) -> void {
  while (!data.empty()) {
    ssize_t n = write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
}

[[noreturn]] auto run_child(const TaskFunction& fn, TaskContext& ctx,
                            const nlohmann::json& args,
                            const nlohmann::json& kwargs, int output_fd,
                            int result_fd) -> void {
  setpgid(0, 0);

  dup2(output_fd, STDOUT_FILENO);
  dup2(output_fd, STDERR_FILENO);
  close(output_fd);

  nlohmann::json payload;
  bool success = false;
  try {
    auto r = fn(ctx, args, kwargs);
    if (r) {
      payload["result"] = std::move(*r);
      success = true;
    } else {
      payload["error"] = r.error().message();
    }
  } catch (const std::exception& e) {
    payload["error"] = std::format("uncaught exception: {}", e.what());
  }

  std::fflush(stdout);
  std::fflush(stderr);
  write_all(result_fd, payload.dump(-1, ' ', false,
                                    nlohmann::json::error_handler_t::replace));
  close(result_fd);
  _exit(success ? 0 : 1);
}

}  // namespace

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto ChildProcess::spawn(const TaskFunction& fn, TaskContext ctx,
                         const nlohmann::json& args,
                         const nlohmann::json& kwargs) -> Result<ChildProcess> {
  auto [output_r, output_w] = create_pipe();
  if (output_r < 0) {
    log::error("Failed to create output pipe: {}", strerror(errno));
    return fail(Error::ProcessSpawnFailed);
  }
  auto [result_r, result_w] = create_pipe();
  if (result_r < 0) {
    log::error("Failed to create result pipe: {}", strerror(errno));
    close(output_r);
    close(output_w);
    return fail(Error::ProcessSpawnFailed);
  }

  // Unflushed stdio buffers would otherwise be written twice.
  std::fflush(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    log::error("fork failed: {}", strerror(errno));
    close(output_r);
    close(output_w);
    close(result_r);
    close(result_w);
    return fail(Error::ProcessSpawnFailed);
  }

  if (pid == 0) {
    close(output_r);
    close(result_r);
    run_child(fn, ctx, args, kwargs, output_w, result_w);
  }

  close(output_w);
  close(result_w);
  setpgid(pid, pid);

  ChildProcess child(pid, output_r, result_r);
  child.pidfd_ = pidfd_open(pid, 0);
  if (child.pidfd_ < 0) {
    log::debug("pidfd_open failed for pid {}, polling waitpid", pid);
  }
  return child;
}

ChildProcess::ChildProcess(pid_t pid, int output_fd, int result_fd) noexcept
    : pid_(pid), output_fd_(output_fd), result_fd_(result_fd) {
  output_.reserve(INITIAL_OUTPUT_RESERVE);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      output_fd_(std::exchange(other.output_fd_, -1)),
      result_fd_(std::exchange(other.result_fd_, -1)),
      pidfd_(std::exchange(other.pidfd_, -1)),
      reaped_(std::exchange(other.reaped_, false)),
      status_(std::exchange(other.status_, 0)),
      output_(std::move(other.output_)),
      result_(std::move(other.result_)) {
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    if (pid_ > 0 && !reaped_) {
      kill();
      (void)reap(true);
    }
    close_fds();
    pid_ = std::exchange(other.pid_, -1);
    output_fd_ = std::exchange(other.output_fd_, -1);
    result_fd_ = std::exchange(other.result_fd_, -1);
    pidfd_ = std::exchange(other.pidfd_, -1);
    reaped_ = std::exchange(other.reaped_, false);
    status_ = std::exchange(other.status_, 0);
    output_ = std::move(other.output_);
    result_ = std::move(other.result_);
  }
  return *this;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0 && !reaped_) {
    kill();
    (void)reap(true);
  }
  close_fds();
}

auto ChildProcess::kill() -> void {
  if (pid_ <= 0 || reaped_) {
    return;
  }
  // The child may not have called setpgid yet.
  if (::kill(-pid_, SIGKILL) < 0) {
    ::kill(pid_, SIGKILL);
  }
}

auto ChildProcess::close_fds() noexcept -> void {
  for (int* fd : {&output_fd_, &result_fd_, &pidfd_}) {
    if (*fd >= 0) {
      close(*fd);
      *fd = -1;
    }
  }
}

auto ChildProcess::append_output(std::string_view chunk) -> void {
  auto old_size = output_.size();
  output_.append(chunk);

  auto search_from = old_size >= kClearOutputMarker.size()
                         ? old_size - kClearOutputMarker.size() + 1
                         : 0;
  if (output_.find(kClearOutputMarker, search_from) != std::string::npos) {
    auto pos = output_.rfind(kClearOutputMarker);
    output_.erase(0, pos + kClearOutputMarker.size());
  }

  if (output_.size() > MAX_OUTPUT_SIZE) {
    output_.resize(MAX_OUTPUT_SIZE);
  }
}

// Returns false once the pipe reached EOF and was closed.
auto ChildProcess::drain_output() -> bool {
  if (output_fd_ < 0) {
    return false;
  }
  std::array<char, READ_BUFFER_SIZE> buffer;
  while (true) {
    ssize_t n = read(output_fd_, buffer.data(), buffer.size());
    if (n > 0) {
      append_output({buffer.data(), static_cast<std::size_t>(n)});
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    close(output_fd_);
    output_fd_ = -1;
    return false;
  }
}

auto ChildProcess::drain_result() -> bool {
  if (result_fd_ < 0) {
    return false;
  }
  std::array<char, READ_BUFFER_SIZE> buffer;
  while (true) {
    ssize_t n = read(result_fd_, buffer.data(), buffer.size());
    if (n > 0) {
      if (result_.size() < MAX_OUTPUT_SIZE) {
        result_.append(buffer.data(), static_cast<std::size_t>(n));
      }
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    close(result_fd_);
    result_fd_ = -1;
    return false;
  }
}

auto ChildProcess::reap(bool block) -> bool {
  if (reaped_) {
    return true;
  }
  if (pid_ <= 0) {
    return false;
  }

  int status = 0;
  while (true) {
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
      reaped_ = true;
      status_ = status;
      return true;
    }
    if (r == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    log::warn("waitpid failed for pid {}: {}", pid_, strerror(errno));
    reaped_ = true;
    status_ = -1;
    return true;
  }
}

auto ChildProcess::wait(const WaitOptions& options) -> ChildResult {
  using steady = std::chrono::steady_clock;

  const auto start = steady::now();
  const auto deadline = start + options.timeout;
  auto next_tick = start + options.tick_interval;
  bool exited = false;
  bool timed_out = false;
  bool cancelled = false;

  while (!exited) {
    auto now = steady::now();
    if (now >= deadline) {
      timed_out = true;
      break;
    }
    if (now >= next_tick) {
      next_tick = now + options.tick_interval;
      if (options.on_tick && !options.on_tick(output_)) {
        cancelled = true;
        break;
      }
    }

    auto wake = std::min(deadline, next_tick);
    auto wait_for = std::chrono::ceil<std::chrono::milliseconds>(wake - now);
    if (pidfd_ < 0) {
      wait_for = std::min(wait_for, kReapPollInterval);
    }

    std::array<pollfd, 3> fds{};
    nfds_t nfds = 0;
    for (int fd : {output_fd_, result_fd_, pidfd_}) {
      if (fd >= 0) {
        fds[nfds++] = {.fd = fd, .events = POLLIN, .revents = 0};
      }
    }

    if (poll(fds.data(), nfds, static_cast<int>(wait_for.count())) < 0 &&
        errno != EINTR) {
      log::warn("poll failed for pid {}: {}", pid_, strerror(errno));
      break;
    }

    drain_output();
    drain_result();
    exited = reap(false);
  }

  if (!exited) {
    kill();
    (void)reap(true);
  }
  drain_output();
  drain_result();
  close_fds();

  ChildResult result;
  result.output = std::move(output_);
  result.exit_code = status_ >= 0 ? get_exit_code(status_) : -1;

  if (timed_out) {
    result.outcome = RunOutcome::TimedOut;
    result.traceback = std::format(
        "timed out after {}s",
        std::chrono::duration_cast<std::chrono::seconds>(options.timeout)
            .count());
    return result;
  }
  if (cancelled) {
    result.outcome = RunOutcome::Cancelled;
    result.traceback = "stopped";
    return result;
  }

  auto payload = nlohmann::json::parse(result_, nullptr, false);
  if (!payload.is_discarded() && payload.is_object()) {
    if (payload.contains("result") && result.exit_code == 0) {
      result.outcome = RunOutcome::Completed;
      result.result = payload["result"].dump();
      return result;
    }
    if (payload.contains("error") && payload["error"].is_string()) {
      result.outcome = RunOutcome::Failed;
      result.traceback = payload["error"].get<std::string>();
      return result;
    }
  }

  result.outcome = RunOutcome::Failed;
  result.traceback = std::format("child exited with status {} without a result",
                                 result.exit_code);
  return result;
}

}  // namespace cronwork
