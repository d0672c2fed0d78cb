#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/executor/task_context.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cronwork {

// Runs inside the child process. Returning an error or throwing marks the
// run failed; the returned JSON is stored as the run result.
using TaskFunction = std::function<Result<nlohmann::json>(
    TaskContext& ctx, const nlohmann::json& args, const nlohmann::json& kwargs)>;

inline constexpr std::string_view kShellFunction = "shell";

// Name -> function table shared by clients (validation) and workers
// (execution). Task rows only ever carry the name.
class FunctionRegistry {
public:
  // Starts with the built-in `shell` function.
  FunctionRegistry();

  [[nodiscard]] auto add(std::string_view name, TaskFunction fn)
      -> Result<void>;
  [[nodiscard]] auto find(std::string_view name) const -> const TaskFunction*;
  [[nodiscard]] auto contains(std::string_view name) const -> bool {
    return find(name) != nullptr;
  }
  [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
  std::unordered_map<std::string, TaskFunction, StringHash, StringEqual>
      functions_;
};

// args[0] is run with /bin/sh -c; kwargs.cwd optionally sets the working
// directory. Succeeds with {"exit_code": 0}, fails on any other status.
[[nodiscard]] auto shell_function(TaskContext& ctx, const nlohmann::json& args,
                                  const nlohmann::json& kwargs)
    -> Result<nlohmann::json>;

}  // namespace cronwork
