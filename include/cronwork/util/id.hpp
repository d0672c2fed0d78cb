#pragma once

#include <cstdint>

namespace cronwork {

// Registry row ids. SQLite assigns them starting at 1, so 0 never names a row.
using TaskId = std::int64_t;
using RunId = std::int64_t;

inline constexpr TaskId kInvalidTaskId = 0;
inline constexpr RunId kInvalidRunId = 0;

}  // namespace cronwork
