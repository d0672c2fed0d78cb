#include "cronwork/scheduler/worker.hpp"
#include "cronwork/scheduler/client.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace cronwork;
using namespace std::chrono_literals;
using nlohmann::json;
using cronwork::test::at;

class WorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    registry_ = std::make_unique<TaskRegistry>(db_.path());
    ASSERT_TRUE(registry_->open().has_value());

    ASSERT_TRUE(functions_
                    .add("echo",
                         [](TaskContext&, const json& args, const json&)
                             -> Result<json> { return json{{"args", args}}; })
                    .has_value());
    ASSERT_TRUE(functions_
                    .add("sleepy",
                         [](TaskContext& ctx, const json&, const json& kwargs)
                             -> Result<json> {
                           ctx.progress("halfway");
                           std::this_thread::sleep_for(std::chrono::milliseconds(
                               kwargs.value("ms", 0)));
                           return json(nullptr);
                         })
                    .has_value());
    ASSERT_TRUE(functions_
                    .add("broken",
                         [](TaskContext&, const json&, const json&)
                             -> Result<json> { return fail(Error::TaskFailed); })
                    .has_value());

    client_ = std::make_unique<TaskClient>(*registry_, nullptr, clock_.fn());
  }

  auto options(std::string name = "w1") -> WorkerOptions {
    return WorkerOptions{.name = std::move(name),
                         .groups = {"main"},
                         .tick_interval = 20ms,
                         .heartbeat_interval = 100ms,
                         .stale_after = 30s,
                         .cancel_check_interval = 50ms};
  }

  auto make_worker(WorkerOptions opts) -> std::unique_ptr<Worker> {
    return std::make_unique<Worker>(*registry_, functions_, std::move(opts),
                                    clock_.fn());
  }

  auto queue(std::string_view fn, TaskOptions opts = {},
             json kwargs = json::object()) -> TaskId {
    auto r = client_->queue_task(fn, json::array({1, 2}), std::move(kwargs),
                                 opts);
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(r && r->ok());
    return r ? r->id : kInvalidTaskId;
  }

  auto runs_of(TaskId id) -> std::vector<RunRecord> {
    auto runs = registry_->get_runs(id);
    EXPECT_TRUE(runs.has_value());
    return runs.value_or(std::vector<RunRecord>{});
  }

  test::TempDb db_;
  test::ManualClock clock_{at()};
  FunctionRegistry functions_;
  std::unique_ptr<TaskRegistry> registry_;
  std::unique_ptr<TaskClient> client_;
};

namespace {

// Polls through a second connection until `id` reaches `status`.
auto wait_for_status(const std::string& db_path, TaskId id, TaskStatus status)
    -> bool {
  TaskRegistry observer(db_path);
  if (!observer.open()) {
    return false;
  }
  auto deadline = std::chrono::steady_clock::now() + 10s;
  while (std::chrono::steady_clock::now() < deadline) {
    auto current = observer.task_status_of(id);
    if (current && *current == status) {
      return true;
    }
    test::sleep_ms(20ms);
  }
  return false;
}

}  // namespace

TEST_F(WorkerTest, OneShotTask_RunsToCompletion) {
  TaskId id = queue("echo");
  auto worker = make_worker(options());

  auto outcome = worker->run_once();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, TickOutcome::Executed);

  auto task = registry_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Completed);
  EXPECT_EQ(task->times_run, 1);
  EXPECT_EQ(task->repeats, 0);

  auto runs = runs_of(id);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].status, RunStatus::Completed);
  EXPECT_EQ(runs[0].worker_name, "w1");
  EXPECT_EQ(json::parse(runs[0].result), json({{"args", {1, 2}}}));

  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
}

TEST_F(WorkerTest, FutureTask_IsNotClaimedEarly) {
  TaskId id = queue("echo", {.start_time = at(1h)});
  auto worker = make_worker(options());

  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Queued);

  clock_.set(at(1h));
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Completed);
}

TEST_F(WorkerTest, OtherGroups_AreIgnored) {
  TaskId id = queue("echo", {.group_name = "reports"});
  auto worker = make_worker(options());

  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Queued);
}

TEST_F(WorkerTest, PreventDrift_KeepsPeriodGrid) {
  TaskId grid = queue("echo", {.period = 60s, .repeats = 3, .prevent_drift = true});
  auto worker = make_worker(options());

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(registry_->get_task(grid)->next_run_time, at(60s));

  // A late run does not shift later fires.
  clock_.set(at(90s));
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  auto task = registry_->get_task(grid);
  EXPECT_EQ(task->next_run_time, at(120s));
  EXPECT_EQ(task->repeats, 1);

  clock_.set(at(120s));
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  task = registry_->get_task(grid);
  EXPECT_EQ(task->status, TaskStatus::Completed);
  EXPECT_EQ(task->times_run, 3);
}

TEST_F(WorkerTest, WithoutPreventDrift_FollowsFinishTime) {
  TaskId id = queue("echo", {.period = 60s, .repeats = 0});
  auto worker = make_worker(options());

  clock_.set(at(25s));
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  auto task = registry_->get_task(id);
  EXPECT_EQ(task->status, TaskStatus::Queued);
  EXPECT_EQ(task->next_run_time, at(85s));
}

TEST_F(WorkerTest, FailedRun_RetriesThenFails) {
  TaskId id = queue("broken", {.retry_failed = 1});
  auto worker = make_worker(options());

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  auto task = registry_->get_task(id);
  EXPECT_EQ(task->status, TaskStatus::Queued);
  EXPECT_EQ(task->times_failed, 1);
  EXPECT_EQ(task->retry_failed, 0);

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  task = registry_->get_task(id);
  EXPECT_EQ(task->status, TaskStatus::Failed);
  EXPECT_EQ(task->times_failed, 2);

  auto runs = runs_of(id);
  ASSERT_EQ(runs.size(), 2u);
  EXPECT_EQ(runs[0].status, RunStatus::Failed);
  EXPECT_EQ(runs[0].traceback, make_error_code(Error::TaskFailed).message());
}

TEST_F(WorkerTest, Timeout_CountsOneFailurePerRun) {
  TaskId id = queue("sleepy", {.timeout = 1s, .retry_failed = 1},
                    {{"ms", 30000}});
  auto worker = make_worker(options());

  auto begin = std::chrono::steady_clock::now();
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);

  auto task = registry_->get_task(id);
  EXPECT_EQ(task->status, TaskStatus::Queued);
  EXPECT_EQ(task->times_failed, 1);
  EXPECT_EQ(task->retry_failed, 0);

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  task = registry_->get_task(id);
  EXPECT_EQ(task->status, TaskStatus::Timeout);
  EXPECT_EQ(task->times_failed, 2);

  auto runs = runs_of(id);
  ASSERT_EQ(runs.size(), 2u);
  for (const auto& run : runs) {
    EXPECT_EQ(run.status, RunStatus::Timeout);
    EXPECT_EQ(run.output, "halfway\n");
  }
}

TEST_F(WorkerTest, UnknownFunction_RecordsFailedRun) {
  TaskId id = queue("ghost");
  auto worker = make_worker(options());

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Failed);

  auto runs = runs_of(id);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].status, RunStatus::Failed);
  EXPECT_EQ(runs[0].traceback, "unknown task function 'ghost'");
}

TEST_F(WorkerTest, Successor_WaitsForPredecessor) {
  TaskId extract = queue("echo", {.task_name = "extract", .start_time = at(1h)});
  TaskId load = queue("echo", {.task_name = "load",
                               .depends_on = {extract},
                               .job_name = "etl"});
  auto worker = make_worker(options());

  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
  EXPECT_EQ(registry_->task_status_of(load).value(), TaskStatus::Queued);

  clock_.set(at(1h));
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(registry_->task_status_of(extract).value(), TaskStatus::Completed);
  EXPECT_EQ(registry_->task_status_of(load).value(), TaskStatus::Queued);

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(registry_->task_status_of(load).value(), TaskStatus::Completed);
}

TEST_F(WorkerTest, BlockedSuccessors_DoNotStarvePredecessor) {
  TaskId extract =
      queue("echo", {.task_name = "extract", .start_time = at(30s)});
  std::vector<TaskId> loads;
  for (int i = 0; i < 20; ++i) {
    loads.push_back(queue("echo", {.task_name = "load",
                                   .depends_on = {extract},
                                   .job_name = "fan-out"}));
  }
  auto worker = make_worker(options());

  clock_.set(at(1min));
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(registry_->task_status_of(extract).value(), TaskStatus::Completed);

  for (std::size_t i = 0; i < loads.size(); ++i) {
    ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  }
  for (auto id : loads) {
    EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Completed);
  }
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
}

TEST_F(WorkerTest, PeriodicSuccessor_RunsOncePerPredecessorRun) {
  TaskId extract = queue("echo", {.task_name = "extract",
                                  .period = 120s,
                                  .repeats = 0});
  TaskId load = queue("echo", {.task_name = "load",
                               .period = 60s,
                               .repeats = 0,
                               .depends_on = {extract},
                               .job_name = "etl"});
  auto worker = make_worker(options());

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  ASSERT_EQ(runs_of(extract).size(), 1u);

  clock_.set(at(10s));
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  ASSERT_EQ(runs_of(load).size(), 1u);

  // load is due again at 70s, but extract has not run since.
  clock_.set(at(80s));
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
  EXPECT_EQ(runs_of(load).size(), 1u);

  clock_.set(at(130s));
  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(runs_of(extract).size(), 2u);
  EXPECT_EQ(runs_of(load).size(), 1u);

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(runs_of(load).size(), 2u);
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
}

TEST_F(WorkerTest, UnrecordedRun_IsWrittenBackOnNextTick) {
  TaskId id = queue("sleepy", {.timeout = 60s}, {{"ms", 1500}});

  TaskRegistry conn(db_.path(), 100ms);
  ASSERT_TRUE(conn.open().has_value());
  Worker worker(conn, functions_, options(), clock_.fn());

  Result<TickOutcome> outcome = fail(Error::Unknown);
  std::thread runner([&] { outcome = worker.run_once(); });
  ASSERT_TRUE(wait_for_status(db_.path(), id, TaskStatus::Running));

  // Hold the write lock until the child is done so the write-back fails.
  TaskRegistry holder(db_.path());
  ASSERT_TRUE(holder.open().has_value());
  ASSERT_TRUE(holder.begin_transaction().has_value());
  runner.join();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, TickOutcome::Executed);
  EXPECT_EQ(holder.task_status_of(id).value(), TaskStatus::Running);
  ASSERT_TRUE(holder.rollback_transaction().has_value());

  EXPECT_EQ(worker.run_once().value(), TickOutcome::Idle);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Completed);
  auto runs = runs_of(id);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].status, RunStatus::Completed);
  EXPECT_EQ(runs[0].output, "halfway\n");
}

TEST_F(WorkerTest, Heartbeat_ReclaimsStaleWorkerTasks) {
  TaskId id = queue("echo");
  WorkerInfo dead{.worker_name = "dead", .group_names = {"main"}};
  ASSERT_TRUE(registry_->heartbeat(dead, at()).has_value());
  ASSERT_TRUE(registry_->claim(id, "dead").has_value());

  auto worker = make_worker(options());
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);

  clock_.set(at(60s));
  ASSERT_TRUE(worker->heartbeat().has_value());
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Queued);
  auto lost = registry_->get_worker("dead");
  ASSERT_FALSE(lost.has_value());
  EXPECT_EQ(lost.error(), make_error_code(Error::NotFound));

  ASSERT_EQ(worker->run_once().value(), TickOutcome::Executed);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Completed);
}

TEST_F(WorkerTest, Heartbeat_ExpiresTasksPastStopTime) {
  TaskId id = queue("echo", {.start_time = at(), .stop_time = at(10s)});
  clock_.set(at(1min));
  auto worker = make_worker(options());

  ASSERT_TRUE(worker->heartbeat().has_value());
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Expired);
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Idle);
}

TEST_F(WorkerTest, StopWhileRunning_KillsChild) {
  TaskId id = queue("sleepy", {.timeout = 60s}, {{"ms", 30000}});
  auto worker = make_worker(options());

  Result<TickOutcome> outcome = fail(Error::Unknown);
  auto begin = std::chrono::steady_clock::now();
  std::thread runner([&] { outcome = worker->run_once(); });

  ASSERT_TRUE(wait_for_status(db_.path(), id, TaskStatus::Running));
  {
    TaskRegistry operator_conn(db_.path());
    ASSERT_TRUE(operator_conn.open().has_value());
    EXPECT_EQ(operator_conn.stop_task(id).value(), TaskStatus::Stopped);
  }
  runner.join();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, TickOutcome::Executed);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 20s);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Stopped);

  auto runs = runs_of(id);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].status, RunStatus::Stopped);
}

TEST_F(WorkerTest, SyncOutput_IsVisibleWhileRunning) {
  TaskId id = queue("sleepy", {.sync_output_interval = 1s}, {{"ms", 3000}});
  auto worker = make_worker(options());

  std::thread runner([&] { (void)worker->run_once(); });
  ASSERT_TRUE(wait_for_status(db_.path(), id, TaskStatus::Running));
  test::sleep_ms(1800ms);

  std::string partial;
  {
    TaskRegistry observer(db_.path());
    ASSERT_TRUE(observer.open().has_value());
    auto runs = observer.get_runs(id);
    ASSERT_TRUE(runs.has_value());
    ASSERT_EQ(runs->size(), 1u);
    EXPECT_EQ(runs->front().status, RunStatus::Running);
    partial = runs->front().output;
  }
  runner.join();

  EXPECT_EQ(partial, "halfway\n");
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Completed);
}

TEST_F(WorkerTest, DisabledWorker_Pauses) {
  TaskId id = queue("echo");
  auto worker = make_worker(options());
  ASSERT_EQ(worker->heartbeat().value(), WorkerStatus::Active);

  ASSERT_TRUE(registry_->set_worker_status("w1", WorkerStatus::Disabled).has_value());
  ASSERT_EQ(worker->heartbeat().value(), WorkerStatus::Disabled);
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Paused);
  EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Queued);

  ASSERT_TRUE(registry_->set_worker_status("w1", WorkerStatus::Active).has_value());
  ASSERT_EQ(worker->heartbeat().value(), WorkerStatus::Active);
  EXPECT_EQ(worker->run_once().value(), TickOutcome::Executed);
}

TEST_F(WorkerTest, TerminatingWorker_LeavesLoopAndDeregisters) {
  auto worker = make_worker(options());
  ASSERT_TRUE(worker->heartbeat().has_value());
  ASSERT_TRUE(
      registry_->set_worker_status("w1", WorkerStatus::Terminating).has_value());

  std::atomic<bool> stop{false};
  worker->run(stop);

  EXPECT_EQ(worker->status(), WorkerStatus::Terminating);
  auto row = registry_->get_worker("w1");
  ASSERT_FALSE(row.has_value());
  EXPECT_EQ(row.error(), make_error_code(Error::NotFound));
}

TEST_F(WorkerTest, MaxEmptyRuns_EndsLoop) {
  auto opts = options();
  opts.max_empty_runs = 3;
  auto worker = make_worker(std::move(opts));

  std::atomic<bool> stop{false};
  worker->run(stop);

  auto workers = registry_->list_workers();
  ASSERT_TRUE(workers.has_value());
  EXPECT_TRUE(workers->empty());
}

TEST_F(WorkerTest, StopFlag_EndsLoop) {
  TaskId id = queue("echo");
  auto worker = make_worker(options());

  std::atomic<bool> stop{false};
  std::thread runner([&] { worker->run(stop); });
  ASSERT_TRUE(wait_for_status(db_.path(), id, TaskStatus::Completed));
  stop.store(true, std::memory_order_release);
  runner.join();

  auto workers = registry_->list_workers();
  ASSERT_TRUE(workers.has_value());
  EXPECT_TRUE(workers->empty());
}

TEST_F(WorkerTest, TwoWorkers_RunEachTaskOnce) {
  std::vector<TaskId> ids;
  for (int i = 0; i < 6; ++i) {
    ids.push_back(queue("echo"));
  }

  std::atomic<bool> stop{false};
  auto run_worker = [&](std::string name) {
    TaskRegistry conn(db_.path());
    ASSERT_TRUE(conn.open().has_value());
    auto opts = options(std::move(name));
    opts.max_empty_runs = 5;
    Worker worker(conn, functions_, std::move(opts), clock_.fn());
    worker.run(stop);
  };
  std::thread a(run_worker, "a");
  std::thread b(run_worker, "b");
  a.join();
  b.join();

  for (auto id : ids) {
    EXPECT_EQ(registry_->task_status_of(id).value(), TaskStatus::Completed);
    EXPECT_EQ(runs_of(id).size(), 1u);
  }
}

TEST(DefaultWorkerNameTest, IsHostAndPid) {
  auto name = default_worker_name();
  auto hash = name.find('#');
  ASSERT_NE(hash, std::string::npos);
  EXPECT_EQ(name.substr(hash + 1), std::to_string(getpid()));
}
