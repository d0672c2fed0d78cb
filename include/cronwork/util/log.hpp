#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <unistd.h>

namespace cronwork::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

// Synchronous logger. Workers fork a child per task, so no background
// writer thread may exist when fork() is called.
class Logger {
public:
  Logger() = default;
  ~Logger() {
    close_file();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Empty path logs to stderr.
  auto open(std::string_view path) -> bool {
    std::lock_guard lock(mutex_);
    close_file_locked();
    if (path.empty()) {
      return true;
    }
    std::string p{path};
    file_ = std::fopen(p.c_str(), "a");
    return file_ != nullptr;
  }

  auto close_file() -> void {
    std::lock_guard lock(mutex_);
    close_file_locked();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_tag(std::string tag) -> void {
    std::lock_guard lock(mutex_);
    tag_ = std::move(tag);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto message = std::format(fmt, std::forward<Args>(args)...);

    std::lock_guard lock(mutex_);
    std::FILE* out = file_ ? file_ : stderr;
    bool color = !file_ && ::isatty(::fileno(stderr)) != 0;
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                            color ? level_color(level) : "", level_name(level),
                            color ? "\033[0m" : "",
                            tag_.empty() ? std::to_string(::getpid()) : tag_,
                            message);
    std::fputs(line.c_str(), out);
    std::fflush(out);
  }

private:
  auto close_file_locked() -> void {
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  std::atomic<Level> level_{Level::Info};
  std::mutex mutex_;
  std::FILE* file_{nullptr};
  std::string tag_;
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto open(std::string_view path) -> bool {
  return logger().open(path);
}

inline auto close() -> void {
  logger().close_file();
}

inline auto set_tag(std::string tag) -> void {
  logger().set_tag(std::move(tag));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace cronwork::log
