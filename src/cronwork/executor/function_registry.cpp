#include "cronwork/executor/function_registry.hpp"

#include "cronwork/executor/child_process.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <format>

#include <unistd.h>

namespace cronwork {

FunctionRegistry::FunctionRegistry() {
  functions_.emplace(std::string(kShellFunction), shell_function);
}

auto FunctionRegistry::add(std::string_view name, TaskFunction fn)
    -> Result<void> {
  if (name.empty() || !fn) {
    return fail(Error::InvalidArgument);
  }
  auto [it, inserted] = functions_.try_emplace(std::string(name), std::move(fn));
  if (!inserted) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto FunctionRegistry::find(std::string_view name) const
    -> const TaskFunction* {
  auto it = functions_.find(name);
  return it != functions_.end() ? &it->second : nullptr;
}

auto FunctionRegistry::names() const -> std::vector<std::string> {
  std::vector<std::string> result;
  result.reserve(functions_.size());
  for (const auto& [name, fn] : functions_) {
    result.push_back(name);
  }
  std::ranges::sort(result);
  return result;
}

auto shell_function(TaskContext& /*ctx*/, const nlohmann::json& args,
                    const nlohmann::json& kwargs) -> Result<nlohmann::json> {
  if (!args.is_array() || args.empty() || !args[0].is_string()) {
    std::fputs("shell: args[0] must be a command string\n", stderr);
    return fail(Error::InvalidArgument);
  }
  auto cmd = args[0].get<std::string>();
  std::string working_dir;
  if (kwargs.is_object() && kwargs.contains("cwd") &&
      kwargs["cwd"].is_string()) {
    working_dir = kwargs["cwd"].get<std::string>();
  }

  std::fflush(nullptr);
  pid_t pid = fork();
  if (pid < 0) {
    return fail(Error::ProcessSpawnFailed);
  }

  if (pid == 0) {
    if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
      _exit(127);
    }
    execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return fail(Error::ProcessSpawnFailed);
    }
  }

  int exit_code = get_exit_code(status);
  if (exit_code != 0) {
    std::fputs(std::format("shell: exit status {}\n", exit_code).c_str(),
               stderr);
    return fail(Error::TaskFailed);
  }
  return nlohmann::json{{"exit_code", exit_code}};
}

}  // namespace cronwork
