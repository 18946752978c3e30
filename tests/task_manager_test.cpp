#include "stepflow/kernel/task_manager.hpp"
#include "stepflow/storage/database.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <set>
#include <thread>

#include "gtest/gtest.h"

using namespace stepflow;
using namespace std::chrono_literals;
using stepflow::test::sleep_ms;

class TaskManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(db_.open().has_value());
    reset_manager({});
  }

  void reset_manager(TaskManagerOptions options) {
    tasks_ = std::make_unique<TaskManager>(db_, options);
  }

  auto enqueue(OwnerId owner = 1, std::string_view kind = "general") -> TaskId {
    auto id = tasks_->enqueue(owner, kind, {.input_text = "hello"});
    EXPECT_TRUE(id.has_value()) << (id ? "" : id.error().message);
    return id.value_or(0);
  }

  auto claim(const char* worker = "w1") -> std::optional<Task> {
    auto r = tasks_->claim(WorkerId(worker));
    EXPECT_TRUE(r.has_value());
    return r ? *r : std::nullopt;
  }

  auto event_types(TaskId id) -> std::vector<std::string> {
    auto events = tasks_->get_task_events(id);
    EXPECT_TRUE(events.has_value());
    std::vector<std::string> types;
    for (const auto& e : events.value_or(std::vector<TaskEvent>{})) {
      types.push_back(e.event_type);
    }
    return types;
  }

  test::TempDir dir_;
  Database db_{dir_.db_path()};
  std::unique_ptr<TaskManager> tasks_;
};

TEST_F(TaskManagerTest, EnqueueCreatesQueuedTask) {
  auto id = tasks_->enqueue(7, "research",
                            {.input_text = "fusion",
                             .input_data = {{"depth", 2}},
                             .max_attempts = 5});
  ASSERT_TRUE(id.has_value());

  auto task = tasks_->get_task(*id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->owner_id, 7);
  EXPECT_EQ(task->kind, "research");
  EXPECT_EQ(task->input_text, "fusion");
  EXPECT_EQ(task->input_data["depth"], 2);
  EXPECT_EQ(task->status, TaskStatus::Queued);
  EXPECT_EQ(task->attempts, 0);
  EXPECT_EQ(task->max_attempts, 5);
  EXPECT_FALSE(task->locked_by.has_value());
  EXPECT_TRUE(task->result.is_null());
  EXPECT_EQ(event_types(*id), std::vector<std::string>{"enqueued"});
  EXPECT_EQ(tasks_->get_queue_size().value_or(-1), 1);
}

TEST_F(TaskManagerTest, EnqueueRejectsInvalidInput) {
  auto empty_kind = tasks_->enqueue(1, "");
  ASSERT_FALSE(empty_kind.has_value());
  EXPECT_EQ(empty_kind.error().code, Error::InvalidArgument);

  auto zero_attempts = tasks_->enqueue(1, "general", {.max_attempts = 0});
  ASSERT_FALSE(zero_attempts.has_value());
  EXPECT_EQ(zero_attempts.error().code, Error::InvalidArgument);

  auto bad_data = tasks_->enqueue(1, "general", {.input_data = nlohmann::json::array()});
  ASSERT_FALSE(bad_data.has_value());
  EXPECT_EQ(bad_data.error().code, Error::InvalidArgument);
}

TEST_F(TaskManagerTest, QueuedQuotaRejectsWithMessage) {
  reset_manager({.max_queued_per_owner = 2, .max_active_per_owner = 5});
  enqueue();
  enqueue();

  auto r = tasks_->enqueue(1, "general");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, Error::QueuedLimitExceeded);
  EXPECT_EQ(r.error().message, "Too many queued tasks: 2/2");

  EXPECT_TRUE(tasks_->enqueue(2, "general").has_value());
}

TEST_F(TaskManagerTest, ActiveQuotaCountsQueuedAndRunningOnly) {
  reset_manager({.max_queued_per_owner = 10, .max_active_per_owner = 2});
  enqueue();
  enqueue();

  auto r = tasks_->enqueue(1, "general");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, Error::ActiveLimitExceeded);
  EXPECT_EQ(r.error().message, "Too many active tasks: 2/2");

  auto task = claim();
  ASSERT_TRUE(task.has_value());
  ASSERT_TRUE(tasks_->pause(task->id, PauseReason::Approval).has_value());
  EXPECT_TRUE(tasks_->enqueue(1, "general").has_value());
}

TEST_F(TaskManagerTest, HourlyQuotaCountsTerminalTasks) {
  reset_manager({.max_queued_per_owner = 10,
                 .max_active_per_owner = 10,
                 .max_tasks_per_hour = 2});
  ASSERT_TRUE(tasks_->cancel(enqueue()).value_or(false));
  ASSERT_TRUE(tasks_->cancel(enqueue()).value_or(false));

  auto r = tasks_->enqueue(1, "general");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, Error::HourlyLimitExceeded);
  EXPECT_EQ(r.error().message, "Too many tasks per hour: 2/2");

  auto limits = tasks_->get_owner_limits(1);
  ASSERT_TRUE(limits.has_value());
  EXPECT_EQ(limits->queued.used, 0);
  EXPECT_EQ(limits->per_hour.used, 2);
  EXPECT_TRUE(limits->per_hour.exhausted());
}

TEST_F(TaskManagerTest, SkipLimitsBypassesQuotas) {
  reset_manager({.max_queued_per_owner = 1});
  enqueue();
  EXPECT_FALSE(tasks_->enqueue(1, "general").has_value());
  EXPECT_TRUE(tasks_->enqueue(1, "general", {.skip_limits = true}).has_value());
}

TEST_F(TaskManagerTest, ClaimTakesOldestAndLeases) {
  auto first = enqueue();
  enqueue();

  auto task = claim("w1");
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->id, first);
  EXPECT_EQ(task->status, TaskStatus::Running);
  EXPECT_EQ(task->attempts, 1);
  EXPECT_EQ(task->locked_by, WorkerId("w1"));
  ASSERT_TRUE(task->lease_expires_at.has_value());
  EXPECT_GT(*task->lease_expires_at, std::chrono::system_clock::now());
  EXPECT_TRUE(task->started_at.has_value());

  auto events = tasks_->get_task_events(first);
  ASSERT_TRUE(events.has_value());
  ASSERT_FALSE(events->empty());
  EXPECT_EQ(events->front().event_type, "claimed");
  EXPECT_EQ(events->front().data["worker_id"], "w1");
  EXPECT_EQ(events->front().data["attempt"], 1);
}

TEST_F(TaskManagerTest, ClaimOnEmptyQueueReturnsNothing) {
  EXPECT_FALSE(claim().has_value());
  auto task = claim();
  EXPECT_FALSE(task.has_value());
}

TEST_F(TaskManagerTest, HeartbeatOnlyForLeaseHolder) {
  auto id = enqueue();
  auto task = claim("w1");
  ASSERT_TRUE(task.has_value());

  EXPECT_TRUE(tasks_->heartbeat(id, WorkerId("w1")).value_or(false));
  EXPECT_FALSE(tasks_->heartbeat(id, WorkerId("w2")).value_or(true));

  ASSERT_TRUE(tasks_->cancel(id).value_or(false));
  EXPECT_FALSE(tasks_->heartbeat(id, WorkerId("w1")).value_or(true));
}

TEST_F(TaskManagerTest, ExpiredLeaseIsReclaimed) {
  reset_manager({.lease_timeout = 1ms});
  auto id = enqueue();
  ASSERT_TRUE(claim("w1").has_value());
  sleep_ms(20ms);

  auto task = claim("w2");
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->id, id);
  EXPECT_EQ(task->attempts, 2);
  EXPECT_EQ(task->locked_by, WorkerId("w2"));
  EXPECT_FALSE(tasks_->heartbeat(id, WorkerId("w1")).value_or(true));
}

TEST_F(TaskManagerTest, ExpiredLeaseWithoutAttemptsLeftFails) {
  reset_manager({.lease_timeout = 1ms, .max_attempts = 1});
  auto id = enqueue();
  ASSERT_TRUE(claim("w1").has_value());
  sleep_ms(20ms);

  EXPECT_FALSE(claim("w2").has_value());
  auto task = tasks_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Failed);
  EXPECT_EQ(task->error, "Lease expired after 1 attempts");
  EXPECT_TRUE(task->completed_at.has_value());
}

TEST_F(TaskManagerTest, PauseAndResume) {
  auto id = enqueue();
  ASSERT_TRUE(claim().has_value());

  ASSERT_TRUE(tasks_->pause(id, PauseReason::Approval,
                            {{"step_id", "s3"}, {"message", "Review"}})
                  .has_value());
  auto paused = tasks_->get_task(id);
  ASSERT_TRUE(paused.has_value());
  EXPECT_EQ(paused->status, TaskStatus::Paused);
  EXPECT_EQ(paused->pause_reason, PauseReason::Approval);
  EXPECT_FALSE(paused->locked_by.has_value());

  auto events = tasks_->get_task_events(id, 1);
  ASSERT_TRUE(events.has_value());
  ASSERT_EQ(events->size(), 1);
  EXPECT_EQ(events->front().event_type, "paused");
  EXPECT_EQ(events->front().data["reason"], "approval");
  EXPECT_EQ(events->front().data["message"], "Review");

  ASSERT_TRUE(tasks_->resume(id).has_value());
  auto resumed = tasks_->get_task(id);
  ASSERT_TRUE(resumed.has_value());
  EXPECT_EQ(resumed->status, TaskStatus::Queued);
  EXPECT_FALSE(resumed->pause_reason.has_value());
}

TEST_F(TaskManagerTest, ResumedTaskIsClaimedAgainWithPlanIntact) {
  auto id = enqueue();
  auto first = claim();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(first->lease_expires_at.has_value());
  ASSERT_TRUE(tasks_->update_step(id, PlanId("plan-1"), StepId("s3")).has_value());
  ASSERT_TRUE(tasks_->pause(id, PauseReason::Approval).has_value());
  ASSERT_TRUE(tasks_->resume(id).has_value());
  sleep_ms(5ms);

  auto again = claim("w2");
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->id, id);
  EXPECT_EQ(again->status, TaskStatus::Running);
  EXPECT_EQ(again->locked_by, WorkerId("w2"));
  ASSERT_TRUE(again->lease_expires_at.has_value());
  EXPECT_GT(*again->lease_expires_at, *first->lease_expires_at);
  EXPECT_EQ(again->current_plan_id, PlanId("plan-1"));
  EXPECT_EQ(again->current_step_id, StepId("s3"));

  auto stored = tasks_->get_task(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TaskStatus::Running);
  EXPECT_EQ(stored->current_plan_id, PlanId("plan-1"));
}

TEST_F(TaskManagerTest, InvalidTransitionsAreRejected) {
  auto id = enqueue();

  auto pause = tasks_->pause(id, PauseReason::Approval);
  ASSERT_FALSE(pause.has_value());
  EXPECT_EQ(pause.error(), Error::InvalidTransition);

  auto resume = tasks_->resume(id);
  ASSERT_FALSE(resume.has_value());
  EXPECT_EQ(resume.error(), Error::InvalidTransition);

  auto succeed = tasks_->succeed(id, {{"ok", true}});
  ASSERT_FALSE(succeed.has_value());
  EXPECT_EQ(succeed.error(), Error::InvalidTransition);

  auto failed = tasks_->fail(id, "boom");
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error(), Error::InvalidTransition);

  auto missing = tasks_->resume(9999);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::NotFound);
}

TEST_F(TaskManagerTest, SucceedStoresResultAndPreview) {
  auto id = enqueue();
  ASSERT_TRUE(claim().has_value());

  std::string long_output(500, 'x');
  ASSERT_TRUE(tasks_->succeed(id, long_output).has_value());

  auto task = tasks_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Succeeded);
  EXPECT_EQ(task->result, long_output);
  EXPECT_TRUE(task->completed_at.has_value());
  EXPECT_FALSE(task->locked_by.has_value());

  auto events = tasks_->get_task_events(id, 1);
  ASSERT_TRUE(events.has_value());
  ASSERT_EQ(events->size(), 1);
  EXPECT_EQ(events->front().event_type, "succeeded");
  EXPECT_EQ(events->front().data["result_preview"].get<std::string>().size(), 200);
}

TEST_F(TaskManagerTest, FailRequeuesUntilAttemptsExhausted) {
  auto id = tasks_->enqueue(1, "general", {.max_attempts = 2}).value_or(0);
  ASSERT_TRUE(claim().has_value());
  ASSERT_TRUE(tasks_->fail(id, "flaky").has_value());

  auto retried = tasks_->get_task(id);
  ASSERT_TRUE(retried.has_value());
  EXPECT_EQ(retried->status, TaskStatus::Queued);
  EXPECT_EQ(retried->error, "flaky");
  EXPECT_FALSE(retried->locked_by.has_value());

  auto again = claim();
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->attempts, 2);
  ASSERT_TRUE(tasks_->fail(id, "flaky again").has_value());

  auto failed = tasks_->get_task(id);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, TaskStatus::Failed);
  EXPECT_EQ(failed->error, "flaky again");
  EXPECT_TRUE(failed->completed_at.has_value());

  auto types = event_types(id);
  EXPECT_EQ(types.front(), "failed");
  EXPECT_NE(std::ranges::find(types, "retry_scheduled"), types.end());
}

TEST_F(TaskManagerTest, NonRetryableFailIsFinal) {
  auto id = enqueue();
  ASSERT_TRUE(claim().has_value());
  ASSERT_TRUE(tasks_->fail(id, "Step limit exceeded: 20/20", false).has_value());

  auto task = tasks_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Failed);
  EXPECT_EQ(task->attempts, 1);
}

TEST_F(TaskManagerTest, CancelIsNoOpForTerminalTasks) {
  auto id = enqueue();
  auto first = tasks_->cancel(id);
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(*first);

  auto task = tasks_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::Cancelled);
  EXPECT_EQ(task->error, "user_cancelled");

  auto second = tasks_->cancel(id, "again");
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(*second);
  EXPECT_EQ(tasks_->get_task(id)->error, "user_cancelled");

  auto missing = tasks_->cancel(4242);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::NotFound);
}

TEST_F(TaskManagerTest, UpdateStepRecordsPosition) {
  auto id = enqueue();
  ASSERT_TRUE(tasks_->update_step(id, PlanId("p1"), StepId("s1")).has_value());

  auto task = tasks_->get_task(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->current_plan_id, PlanId("p1"));
  EXPECT_EQ(task->current_step_id, StepId("s1"));

  ASSERT_TRUE(tasks_->update_step(id, PlanId("p1"), std::nullopt).has_value());
  EXPECT_FALSE(tasks_->get_task(id)->current_step_id.has_value());

  auto missing = tasks_->update_step(777, PlanId("p1"), std::nullopt);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::NotFound);
}

TEST_F(TaskManagerTest, RecordEventKeepsStepAndTool) {
  auto id = enqueue();
  ASSERT_TRUE(tasks_->record_event(id, "tool_called", {{"latency_ms", 12}},
                                   StepId("s2"), std::string("web_search"))
                  .has_value());

  auto events = tasks_->get_task_events(id, 1);
  ASSERT_TRUE(events.has_value());
  ASSERT_EQ(events->size(), 1);
  const auto& e = events->front();
  EXPECT_EQ(e.event_type, "tool_called");
  EXPECT_EQ(e.task_id, id);
  EXPECT_EQ(e.step_id, StepId("s2"));
  EXPECT_EQ(e.tool_name, "web_search");
  EXPECT_EQ(e.data["latency_ms"], 12);
}

TEST_F(TaskManagerTest, OwnerTasksNewestFirstWithStatusFilter) {
  auto a = enqueue(3);
  auto b = enqueue(3);
  enqueue(4);
  ASSERT_TRUE(tasks_->cancel(a).value_or(false));

  auto all = tasks_->get_owner_tasks(3);
  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 2);
  EXPECT_EQ((*all)[0].id, b);
  EXPECT_EQ((*all)[1].id, a);

  auto cancelled = tasks_->get_owner_tasks(3, TaskStatus::Cancelled);
  ASSERT_TRUE(cancelled.has_value());
  ASSERT_EQ(cancelled->size(), 1);
  EXPECT_EQ(cancelled->front().id, a);

  auto limited = tasks_->get_owner_tasks(3, std::nullopt, 1);
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 1);
}

TEST_F(TaskManagerTest, PurgeRemovesOldEvents) {
  auto id = enqueue();
  ASSERT_TRUE(claim().has_value());

  auto none = tasks_->purge_events_before(std::chrono::system_clock::now() - 1h);
  ASSERT_TRUE(none.has_value());
  EXPECT_EQ(*none, 0);

  auto all = tasks_->purge_events_before(std::chrono::system_clock::now() + 1h);
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(*all, 2);
  EXPECT_TRUE(event_types(id).empty());
}

TEST_F(TaskManagerTest, ConcurrentWorkersClaimEachTaskOnce) {
  constexpr int kTasks = 40;
  constexpr int kWorkers = 4;
  for (int i = 0; i < kTasks; ++i) {
    ASSERT_TRUE(tasks_->enqueue(i, "general").has_value());
  }

  std::vector<std::unique_ptr<Database>> conns;
  std::vector<std::unique_ptr<TaskManager>> managers;
  for (int w = 0; w < kWorkers; ++w) {
    conns.push_back(std::make_unique<Database>(dir_.db_path()));
    ASSERT_TRUE(conns.back()->open().has_value());
    managers.push_back(std::make_unique<TaskManager>(*conns.back()));
  }

  std::mutex mu;
  std::vector<TaskId> claimed;
  std::atomic<int> errors{0};
  std::vector<std::thread> threads;
  for (int w = 0; w < kWorkers; ++w) {
    threads.emplace_back([&, w] {
      WorkerId worker(std::format("w{}", w));
      for (;;) {
        auto r = managers[w]->claim(worker);
        if (!r) {
          errors.fetch_add(1);
          return;
        }
        if (!*r) {
          return;
        }
        std::lock_guard lock(mu);
        claimed.push_back((*r)->id);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(errors.load(), 0);
  ASSERT_EQ(claimed.size(), kTasks);
  std::set<TaskId> unique(claimed.begin(), claimed.end());
  EXPECT_EQ(unique.size(), kTasks);
  EXPECT_EQ(tasks_->get_queue_size().value_or(-1), 0);
}
