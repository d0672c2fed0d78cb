#include "cronwork/scheduler/reschedule.hpp"

#include "test_utils.hpp"

#include <chrono>

#include "gtest/gtest.h"

using namespace cronwork;
using namespace std::chrono_literals;
using cronwork::test::at;
using cronwork::test::utc;

namespace {

auto periodic_task(std::chrono::seconds period, bool prevent_drift,
                   int repeats) -> Task {
  Task t;
  t.id = 1;
  t.function_ref = "shell";
  t.start_time = at();
  t.next_run_time = at();
  t.period = period;
  t.prevent_drift = prevent_drift;
  t.repeats = repeats;
  return t;
}

auto apply(Task& task, const TaskUpdate& u) -> void {
  task.status = u.status;
  task.next_run_time = u.next_run_time;
  task.repeats = u.repeats;
  task.retry_failed = u.retry_failed;
  task.times_failed = u.times_failed;
  task.times_run = u.times_run;
}

}  // namespace

TEST(RescheduleTest, RetryModeNames) {
  EXPECT_EQ(parse_retry_mode("immediate"), RetryMode::Immediate);
  EXPECT_EQ(parse_retry_mode("delayed"), RetryMode::Delayed);
  EXPECT_EQ(parse_retry_mode("schedule"), RetryMode::Schedule);
  EXPECT_FALSE(parse_retry_mode("exponential").has_value());
  EXPECT_STREQ(retry_mode_name(RetryMode::Delayed), "delayed");
}

TEST(RescheduleTest, FirstFireTime) {
  Task t;
  t.start_time = at(100s);
  EXPECT_EQ(first_fire_time(t, at()).value(), at(100s));

  t.immediate = true;
  EXPECT_EQ(first_fire_time(t, at()).value(), at());

  Task cron;
  cron.cron = "0 * * * *";
  cron.start_time = at(90min);
  EXPECT_EQ(first_fire_time(cron, at()).value(), at(2h));

  Task unset;
  EXPECT_EQ(first_fire_time(unset, at(5s)).value(), at(5s));
}

TEST(RescheduleTest, PreventDriftKeepsGrid) {
  RetryPolicy policy;
  Task task = periodic_task(60s, true, 3);
  std::vector<TimePoint> fires;

  for (int i = 0; i < 5 && task.status == TaskStatus::Queued; ++i) {
    fires.push_back(task.next_run_time);
    // Each run takes 10s.
    auto finish = task.next_run_time + 10s;
    apply(task, decide_next(task, RunOutcome::Completed, finish, policy));
  }

  EXPECT_EQ(fires, (std::vector<TimePoint>{at(), at(60s), at(120s)}));
  EXPECT_EQ(task.status, TaskStatus::Completed);
  EXPECT_EQ(task.times_run, 3);
  EXPECT_EQ(task.repeats, 0);
}

TEST(RescheduleTest, PreventDriftSkipsMissedSlots) {
  Task task = periodic_task(60s, true, 0);
  auto u = decide_next(task, RunOutcome::Completed, at(200s), {});
  EXPECT_EQ(u.next_run_time, at(240s));
}

TEST(RescheduleTest, DriftFollowsFinishTime) {
  Task task = periodic_task(60s, false, 0);
  auto u = decide_next(task, RunOutcome::Completed, at(10s), {});
  EXPECT_EQ(u.status, TaskStatus::Queued);
  EXPECT_EQ(u.next_run_time, at(70s));
  EXPECT_EQ(u.repeats, 0);
}

TEST(RescheduleTest, CronTaskUsesNextFire) {
  Task task;
  task.cron = "0 0 1 * *";
  task.repeats = 0;
  task.next_run_time = utc(2024, 2, 1);
  auto u = decide_next(task, RunOutcome::Completed, utc(2024, 2, 1, 0, 5), {});
  EXPECT_EQ(u.next_run_time, utc(2024, 3, 1));
}

TEST(RescheduleTest, OneShotCompletes) {
  Task task;
  task.next_run_time = at();
  auto u = decide_next(task, RunOutcome::Completed, at(1s), {});
  EXPECT_EQ(u.status, TaskStatus::Completed);
  EXPECT_EQ(u.times_run, 1);
}

TEST(RescheduleTest, StopTimeIsInclusive) {
  Task task = periodic_task(60s, true, 0);
  task.stop_time = at(60s);

  auto first = decide_next(task, RunOutcome::Completed, at(1s), {});
  EXPECT_EQ(first.status, TaskStatus::Queued);
  EXPECT_EQ(first.next_run_time, at(60s));

  apply(task, first);
  auto second = decide_next(task, RunOutcome::Completed, at(61s), {});
  EXPECT_EQ(second.status, TaskStatus::Completed);
}

TEST(RescheduleTest, FailureWithRetryRequeues) {
  Task task = periodic_task(60s, false, 2);
  task.retry_failed = 1;

  auto u = decide_next(task, RunOutcome::Failed, at(5s), {});
  EXPECT_EQ(u.status, TaskStatus::Queued);
  EXPECT_EQ(u.next_run_time, at(5s));
  EXPECT_EQ(u.retry_failed, 0);
  EXPECT_EQ(u.times_failed, 1);
  // Failures do not consume repeats.
  EXPECT_EQ(u.repeats, 2);
}

TEST(RescheduleTest, FailureWithoutRetryIsTerminal) {
  Task task = periodic_task(60s, false, 0);
  auto u = decide_next(task, RunOutcome::Failed, at(5s), {});
  EXPECT_EQ(u.status, TaskStatus::Failed);
  EXPECT_EQ(u.times_failed, 1);
}

TEST(RescheduleTest, TimeoutRetryIncrementsFailuresOnce) {
  Task task = periodic_task(60s, false, 1);
  task.retry_failed = 2;
  task.times_failed = 4;

  auto u = decide_next(task, RunOutcome::TimedOut, at(30s), {});
  EXPECT_EQ(u.status, TaskStatus::Queued);
  EXPECT_EQ(u.times_failed, 5);
  EXPECT_EQ(u.retry_failed, 1);

  task.retry_failed = 0;
  auto last = decide_next(task, RunOutcome::TimedOut, at(30s), {});
  EXPECT_EQ(last.status, TaskStatus::Timeout);
}

TEST(RescheduleTest, RetryPolicies) {
  Task task = periodic_task(60s, true, 0);
  task.retry_failed = 3;

  RetryPolicy delayed{.mode = RetryMode::Delayed, .delay = 30s};
  EXPECT_EQ(decide_next(task, RunOutcome::Failed, at(5s), delayed).next_run_time,
            at(35s));

  RetryPolicy schedule{.mode = RetryMode::Schedule};
  EXPECT_EQ(
      decide_next(task, RunOutcome::Failed, at(5s), schedule).next_run_time,
      at(60s));

  Task one_shot;
  one_shot.retry_failed = 1;
  EXPECT_EQ(
      decide_next(one_shot, RunOutcome::Failed, at(5s), schedule).next_run_time,
      at(5s));
}

TEST(RescheduleTest, RetryPastStopTimeIsTerminal) {
  Task task = periodic_task(60s, false, 0);
  task.retry_failed = 1;
  task.stop_time = at(10s);
  RetryPolicy delayed{.mode = RetryMode::Delayed, .delay = 30s};
  auto u = decide_next(task, RunOutcome::Failed, at(5s), delayed);
  EXPECT_EQ(u.status, TaskStatus::Failed);
}

TEST(RescheduleTest, CancelledStops) {
  Task task = periodic_task(60s, false, 0);
  auto u = decide_next(task, RunOutcome::Cancelled, at(5s), {});
  EXPECT_EQ(u.status, TaskStatus::Stopped);
  EXPECT_EQ(run_status_for(RunOutcome::Cancelled), RunStatus::Stopped);
  EXPECT_EQ(run_status_for(RunOutcome::TimedOut), RunStatus::Timeout);
}
