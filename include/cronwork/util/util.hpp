#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <random>
#include <string>

namespace cronwork {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  // RFC 4122 version 4 layout
  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

[[nodiscard]] inline auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

[[nodiscard]] inline auto from_epoch_seconds(std::int64_t s) -> TimePoint {
  return TimePoint(std::chrono::seconds(s));
}

// Renders as UTC, e.g. 2024-02-29T00:00:00Z. The zero time point renders "-".
inline auto format_time(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

}  // namespace cronwork
