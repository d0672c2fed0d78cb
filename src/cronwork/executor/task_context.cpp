#include "cronwork/executor/task_context.hpp"

#include <cstdio>

namespace cronwork {

auto TaskContext::progress(std::string_view message) const -> void {
  std::fwrite(message.data(), 1, message.size(), stdout);
  std::fputc('\n', stdout);
  std::fflush(stdout);
}

auto TaskContext::clear_output() const -> void {
  std::fwrite(kClearOutputMarker.data(), 1, kClearOutputMarker.size(), stdout);
  std::fflush(stdout);
}

}  // namespace cronwork
