#include "cronwork/executor/child_process.hpp"
#include "cronwork/executor/function_registry.hpp"
#include "cronwork/executor/task_context.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include <sys/wait.h>
#include <unistd.h>

using namespace cronwork;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

auto run(const TaskFunction& fn, json args = json::array(),
         json kwargs = json::object(), WaitOptions options = {}) -> ChildResult {
  TaskContext ctx(7, "uuid-7", "sample", 11, "tester");
  auto child = ChildProcess::spawn(fn, std::move(ctx), args, kwargs);
  EXPECT_TRUE(child.has_value());
  if (!child) {
    return {};
  }
  return child->wait(options);
}

}  // namespace

TEST(ChildProcessTest, ReturnedValue_BecomesResult) {
  auto result = run([](TaskContext&, const json& args, const json&)
                        -> Result<json> {
    return json{{"sum", args[0].get<int>() + args[1].get<int>()}};
  }, json::array({2, 3}));

  EXPECT_EQ(result.outcome, RunOutcome::Completed);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(json::parse(result.result), json({{"sum", 5}}));
  EXPECT_TRUE(result.traceback.empty());
}

TEST(ChildProcessTest, ContextIsVisibleInsideChild) {
  auto result = run([](TaskContext& ctx, const json&, const json&)
                        -> Result<json> {
    return json{{"task", ctx.task_id()},
                {"uuid", ctx.uuid()},
                {"run", ctx.run_id()},
                {"worker", ctx.worker_name()}};
  });

  ASSERT_EQ(result.outcome, RunOutcome::Completed);
  auto payload = json::parse(result.result);
  EXPECT_EQ(payload["task"], 7);
  EXPECT_EQ(payload["uuid"], "uuid-7");
  EXPECT_EQ(payload["run"], 11);
  EXPECT_EQ(payload["worker"], "tester");
}

TEST(ChildProcessTest, StdoutAndStderr_AreCaptured) {
  auto result = run([](TaskContext& ctx, const json&, const json&)
                        -> Result<json> {
    ctx.progress("step 1");
    std::fputs("warning\n", stderr);
    return json(nullptr);
  });

  EXPECT_EQ(result.outcome, RunOutcome::Completed);
  EXPECT_NE(result.output.find("step 1\n"), std::string::npos);
  EXPECT_NE(result.output.find("warning\n"), std::string::npos);
}

TEST(ChildProcessTest, ClearMarker_DiscardsEarlierOutput) {
  auto result = run([](TaskContext& ctx, const json&, const json&)
                        -> Result<json> {
    ctx.progress("10%");
    ctx.progress("50%");
    ctx.clear_output();
    ctx.progress("100%");
    return json(true);
  });

  EXPECT_EQ(result.outcome, RunOutcome::Completed);
  EXPECT_EQ(result.output, "100%\n");
}

TEST(ChildProcessTest, ErrorResult_MarksRunFailed) {
  auto result = run([](TaskContext&, const json&, const json&)
                        -> Result<json> { return fail(Error::TaskFailed); });

  EXPECT_EQ(result.outcome, RunOutcome::Failed);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.traceback, make_error_code(Error::TaskFailed).message());
  EXPECT_TRUE(result.result.empty());
}

TEST(ChildProcessTest, Exception_MarksRunFailedWithMessage) {
  auto result = run([](TaskContext&, const json&, const json&)
                        -> Result<json> {
    throw std::runtime_error("boom");
  });

  EXPECT_EQ(result.outcome, RunOutcome::Failed);
  EXPECT_NE(result.traceback.find("boom"), std::string::npos);
}

TEST(ChildProcessTest, ChildDyingWithoutResult_MarksRunFailed) {
  auto result = run([](TaskContext&, const json&, const json&)
                        -> Result<json> { std::_Exit(3); });

  EXPECT_EQ(result.outcome, RunOutcome::Failed);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_NE(result.traceback.find("without a result"), std::string::npos);
}

TEST(ChildProcessTest, Timeout_KillsChild) {
  WaitOptions options{.timeout = 200ms, .tick_interval = 50ms};
  auto begin = std::chrono::steady_clock::now();
  auto result = run([](TaskContext& ctx, const json&, const json&)
                        -> Result<json> {
    ctx.progress("started");
    std::this_thread::sleep_for(30s);
    return json(nullptr);
  }, json::array(), json::object(), options);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_EQ(result.outcome, RunOutcome::TimedOut);
  EXPECT_EQ(result.exit_code, 128 + SIGKILL);
  EXPECT_EQ(result.output, "started\n");
  EXPECT_LT(elapsed, 10s);
}

TEST(ChildProcessTest, TickReturningFalse_CancelsChild) {
  int ticks = 0;
  std::string seen;
  WaitOptions options{
      .timeout = 30s,
      .tick_interval = 50ms,
      .on_tick = [&](std::string_view output) {
        seen = output;
        return ++ticks < 4;
      }};
  auto result = run([](TaskContext& ctx, const json&, const json&)
                        -> Result<json> {
    ctx.progress("working");
    std::this_thread::sleep_for(30s);
    return json(nullptr);
  }, json::array(), json::object(), options);

  EXPECT_EQ(result.outcome, RunOutcome::Cancelled);
  EXPECT_EQ(ticks, 4);
  EXPECT_EQ(seen, "working\n");
}

TEST(ShellFunctionTest, ZeroExit_Completes) {
  auto result = run(shell_function, json::array({"echo hello"}));

  EXPECT_EQ(result.outcome, RunOutcome::Completed);
  EXPECT_EQ(result.output, "hello\n");
  EXPECT_EQ(json::parse(result.result), json({{"exit_code", 0}}));
}

TEST(ShellFunctionTest, NonZeroExit_Fails) {
  auto result = run(shell_function, json::array({"echo oops >&2; exit 3"}));

  EXPECT_EQ(result.outcome, RunOutcome::Failed);
  EXPECT_NE(result.output.find("oops"), std::string::npos);
  EXPECT_NE(result.output.find("exit status 3"), std::string::npos);
}

TEST(ShellFunctionTest, WorkingDirectoryFromKwargs) {
  auto result = run(shell_function, json::array({"pwd"}), {{"cwd", "/tmp"}});

  EXPECT_EQ(result.outcome, RunOutcome::Completed);
  EXPECT_EQ(result.output, "/tmp\n");
}

TEST(ShellFunctionTest, MissingCommand_Fails) {
  auto result = run(shell_function, json::array());

  EXPECT_EQ(result.outcome, RunOutcome::Failed);
  EXPECT_EQ(result.traceback,
            make_error_code(Error::InvalidArgument).message());
}

TEST(ExitCodeTest, ExitStatusOrSignalOffset) {
  pid_t exited = fork();
  ASSERT_GE(exited, 0);
  if (exited == 0) {
    std::_Exit(5);
  }
  int status = 0;
  ASSERT_EQ(waitpid(exited, &status, 0), exited);
  EXPECT_EQ(get_exit_code(status), 5);

  pid_t killed = fork();
  ASSERT_GE(killed, 0);
  if (killed == 0) {
    pause();
    std::_Exit(0);
  }
  ASSERT_EQ(kill(killed, SIGTERM), 0);
  ASSERT_EQ(waitpid(killed, &status, 0), killed);
  EXPECT_EQ(get_exit_code(status), 128 + SIGTERM);
}

TEST(FunctionRegistryTest, ShellIsBuiltIn) {
  FunctionRegistry registry;
  EXPECT_TRUE(registry.contains(kShellFunction));
  EXPECT_FALSE(registry.contains("missing"));
  EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST(FunctionRegistryTest, Add_RejectsDuplicatesAndEmptyNames) {
  FunctionRegistry registry;
  auto noop = [](TaskContext&, const json&, const json&) -> Result<json> {
    return json(nullptr);
  };

  EXPECT_TRUE(registry.add("report", noop).has_value());

  auto dup = registry.add("report", noop);
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error(), make_error_code(Error::AlreadyExists));

  auto empty = registry.add("", noop);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), make_error_code(Error::InvalidArgument));

  auto null_fn = registry.add("null", TaskFunction{});
  ASSERT_FALSE(null_fn.has_value());
  EXPECT_EQ(null_fn.error(), make_error_code(Error::InvalidArgument));
}

TEST(FunctionRegistryTest, Names_AreSorted) {
  FunctionRegistry registry;
  auto noop = [](TaskContext&, const json&, const json&) -> Result<json> {
    return json(nullptr);
  };
  ASSERT_TRUE(registry.add("zeta", noop).has_value());
  ASSERT_TRUE(registry.add("alpha", noop).has_value());

  EXPECT_EQ(registry.names(),
            (std::vector<std::string>{"alpha", "shell", "zeta"}));
}

TEST(TaskContextTest, DefaultConstruction_HasInvalidIds) {
  TaskContext ctx;
  EXPECT_EQ(ctx.task_id(), kInvalidTaskId);
  EXPECT_EQ(ctx.run_id(), kInvalidRunId);
  EXPECT_TRUE(ctx.uuid().empty());
}
