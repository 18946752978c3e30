#include "stepflow/executor/builtin_handlers.hpp"
#include "stepflow/executor/executor.hpp"
#include "stepflow/storage/database.hpp"
#include "stepflow/storage/snapshot_store.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <memory>

#include "gtest/gtest.h"

using namespace stepflow;
using namespace std::chrono_literals;
using stepflow::test::FunctionHandler;
using stepflow::test::make_step;
using stepflow::test::step_id;

class ExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(db_.open().has_value());
    llm_ = std::make_shared<FunctionHandler>([](const ActionRequest& req) -> HandlerResult {
      auto purpose = req.params.value("purpose", std::string{});
      if (purpose == "generate_draft") {
        return StepCompleted{
            .result = {{"response", "Draft about " + req.params.value("input_text", std::string{})}},
            .skip = {}};
      }
      return StepCompleted{.result = {{"echo", purpose}}, .skip = {}};
    });
    tool_ = test::echo_handler();
    registry_.register_handler(ActionKind::LlmCall, llm_);
    registry_.register_handler(ActionKind::ToolCall, tool_);
  }

  auto make_executor(ExecutionLimits limits = {}) -> std::unique_ptr<Executor> {
    return std::make_unique<Executor>(tasks_, planner_, plans_, steps_,
                                      ExecutorOptions{
                                          .worker_id = WorkerId("w1"),
                                          .poll_interval = 10ms,
                                          .limits = limits,
                                      });
  }

  auto submit(std::string kind, std::string text = "topic",
              nlohmann::json data = nlohmann::json::object()) -> TaskId {
    auto id = tasks_.enqueue(7, kind,
                             EnqueueOptions{.input_text = std::move(text),
                                            .input_data = std::move(data)});
    EXPECT_TRUE(id.has_value());
    return id.value_or(0);
  }

  auto run_once(Executor& executor) -> TaskId {
    auto processed = executor.process_one();
    EXPECT_TRUE(processed.has_value());
    EXPECT_TRUE(processed && processed->has_value());
    return processed && *processed ? **processed : 0;
  }

  auto task(TaskId id) -> Task {
    auto t = tasks_.get_task(id);
    EXPECT_TRUE(t.has_value());
    return t.value_or(Task{});
  }

  auto event_types(TaskId id) -> std::vector<std::string> {
    std::vector<std::string> types;
    auto events = tasks_.get_task_events(id);
    EXPECT_TRUE(events.has_value());
    if (events) {
      for (const auto& e : *events) {
        types.push_back(e.event_type);
      }
    }
    return types;
  }

  static auto count_of(const std::vector<std::string>& v, std::string_view s) -> long {
    return std::ranges::count(v, s);
  }

  test::TempDir dir_;
  Database db_{dir_.db_path()};
  TaskManager tasks_{db_};
  SnapshotStore snapshots_{dir_.snapshot_dir()};
  PlanStore plans_{db_, snapshots_};
  PlanManager planner_;
  HandlerRegistry registry_ = make_builtin_registry();
  StepExecutor steps_{registry_, tasks_, 0ms};
  std::shared_ptr<FunctionHandler> llm_;
  std::shared_ptr<FunctionHandler> tool_;
};

TEST_F(ExecutorTest, EmptyQueueProcessesNothing) {
  auto executor = make_executor();
  auto processed = executor->process_one();
  ASSERT_TRUE(processed.has_value());
  EXPECT_FALSE(processed->has_value());
}

TEST_F(ExecutorTest, RunsResearchPlanToSuccess) {
  auto id = submit("research", "solar panels");
  auto executor = make_executor();

  EXPECT_EQ(run_once(*executor), id);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Succeeded);
  EXPECT_EQ(t.attempts, 1);
  ASSERT_TRUE(t.current_plan_id.has_value());
  EXPECT_EQ(t.result["success"], true);
  EXPECT_EQ(t.result["steps_executed"], 3);
  EXPECT_EQ(t.result["primary_output"]["echo"], "synthesize");
  EXPECT_EQ(t.result["step_results"].size(), 3);
  EXPECT_EQ(tool_->calls(), 1);
  EXPECT_EQ(llm_->calls(), 2);

  auto types = event_types(id);
  EXPECT_EQ(count_of(types, "step_started"), 3);
  EXPECT_EQ(count_of(types, "step_completed"), 3);
  EXPECT_EQ(count_of(types, "succeeded"), 1);

  auto plan = plans_.load(id, *t.current_plan_id);
  ASSERT_TRUE(plan.has_value());
  EXPECT_TRUE(plan->is_complete());
  EXPECT_TRUE(std::filesystem::exists(snapshots_.path_for(*t.current_plan_id)));
}

TEST_F(ExecutorTest, UnknownKindRunsGeneralPlan) {
  auto id = submit("no-such-kind", "do it");
  auto executor = make_executor();

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Succeeded);
  EXPECT_EQ(t.result["steps_executed"], 2);
  EXPECT_EQ(t.result["primary_output"]["echo"], "execute");
}

TEST_F(ExecutorTest, MistypedInputStillPlans) {
  auto id = submit("generate", "",
                   {{"owner_id", "42"}, {"temperature", "hot"}, {"skip_web_search", "yes"}});
  auto executor = make_executor();

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Paused);
  EXPECT_EQ(t.attempts, 1);
  EXPECT_FALSE(t.error.has_value());
  EXPECT_EQ(tool_->calls(), 2);
}

TEST_F(ExecutorTest, ApprovalSuspendsThenApprovedDraftCompletes) {
  auto id = submit("generate", "rust async");
  auto executor = make_executor();

  run_once(*executor);

  auto paused = task(id);
  EXPECT_EQ(paused.status, TaskStatus::Paused);
  EXPECT_EQ(paused.pause_reason, PauseReason::Approval);
  ASSERT_TRUE(paused.current_step_id.has_value());
  EXPECT_EQ(count_of(event_types(id), "approval_required"), 1);
  EXPECT_EQ(llm_->calls(), 1);

  ASSERT_TRUE(executor->handle_approval(id, true).has_value());
  EXPECT_EQ(task(id).status, TaskStatus::Queued);
  EXPECT_EQ(count_of(event_types(id), "approved"), 1);

  run_once(*executor);

  auto done = task(id);
  EXPECT_EQ(done.status, TaskStatus::Succeeded);
  // Completed steps are restored, not re-run.
  EXPECT_EQ(llm_->calls(), 1);
  EXPECT_EQ(tool_->calls(), 2);
  EXPECT_EQ(done.result["steps_executed"], 0);
  EXPECT_EQ(done.result["primary_output"]["approved"], true);
  EXPECT_EQ(done.result["primary_output"]["content"], "Draft about rust async");
}

TEST_F(ExecutorTest, ApprovalWithEditedContent) {
  auto id = submit("generate", "topic", {{"skip_web_search", true}});
  auto executor = make_executor();
  run_once(*executor);

  ASSERT_TRUE(executor->handle_approval(id, true, "Edited by hand").has_value());
  run_once(*executor);

  auto done = task(id);
  EXPECT_EQ(done.status, TaskStatus::Succeeded);
  EXPECT_EQ(tool_->calls(), 1);
  EXPECT_EQ(done.result["primary_output"]["content"], "Edited by hand");
}

TEST_F(ExecutorTest, RejectionCancelsTask) {
  auto id = submit("generate");
  auto executor = make_executor();
  run_once(*executor);

  ASSERT_TRUE(executor->handle_approval(id, false).has_value());

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Cancelled);
  EXPECT_EQ(t.error, "user_rejected");
}

TEST_F(ExecutorTest, ApprovalRequiresPausedTask) {
  auto id = submit("general");
  auto executor = make_executor();

  auto r = executor->handle_approval(id, true);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidTransition);

  auto missing = executor->handle_approval(999, true);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::NotFound);
}

TEST_F(ExecutorTest, ApprovalRestoresPlanFromRowsWithoutSnapshot) {
  auto id = submit("generate", "rows");
  auto executor = make_executor();
  run_once(*executor);

  auto plan_id = task(id).current_plan_id;
  ASSERT_TRUE(plan_id.has_value());
  snapshots_.remove(*plan_id);
  ASSERT_FALSE(std::filesystem::exists(snapshots_.path_for(*plan_id)));

  ASSERT_TRUE(executor->handle_approval(id, true).has_value());
  run_once(*executor);

  auto done = task(id);
  EXPECT_EQ(done.status, TaskStatus::Succeeded);
  EXPECT_EQ(done.result["primary_output"]["content"], "Draft about rows");
}

TEST_F(ExecutorTest, StepLimitFailsWithoutRetry) {
  auto id = submit("research");
  auto executor = make_executor(ExecutionLimits{.max_steps = 1, .max_wall_time = 300s});

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Failed);
  EXPECT_EQ(t.error, "Step limit exceeded: 1/1");
  EXPECT_EQ(t.attempts, 1);
  EXPECT_EQ(tool_->calls(), 1);
  EXPECT_EQ(llm_->calls(), 0);
}

TEST_F(ExecutorTest, WallTimeLimitFailsWithoutRetry) {
  auto id = submit("general");
  auto executor = make_executor(ExecutionLimits{.max_steps = 20, .max_wall_time = 0s});

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Failed);
  EXPECT_EQ(t.attempts, 1);
  ASSERT_TRUE(t.error.has_value());
  EXPECT_TRUE(t.error->starts_with("Time limit exceeded")) << *t.error;
  EXPECT_EQ(llm_->calls(), 0);
}

TEST_F(ExecutorTest, DiamondPlanRunsInDependencyOrder) {
  std::vector<std::string> order;
  registry_.register_handler(
      ActionKind::LlmCall,
      std::make_shared<FunctionHandler>([&order](const ActionRequest& req) -> HandlerResult {
        order.push_back(req.step_id.str());
        return StepCompleted{.result = {{"step", req.step_id.str()}}, .skip = {}};
      }));
  // Listed out of dependency order on purpose: s3 and s4 come first.
  planner_.register_strategy("diamond", [](const PlanRequest&) {
    return std::vector<Step>{
        make_step("s4", ActionKind::LlmCall, {}, {step_id("s3")}),
        make_step("s3", ActionKind::LlmCall, {}, {step_id("s1"), step_id("s2")}),
        make_step("s1"),
        make_step("s2"),
    };
  });
  auto id = submit("diamond");
  auto executor = make_executor();

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Succeeded);
  ASSERT_EQ(order.size(), 4);
  auto pos = [&](const char* s) { return std::ranges::find(order, s) - order.begin(); };
  EXPECT_LT(pos("s1"), pos("s3"));
  EXPECT_LT(pos("s2"), pos("s3"));
  EXPECT_LT(pos("s3"), pos("s4"));
  EXPECT_EQ(t.result["primary_output"]["step"], "s4");
}

TEST_F(ExecutorTest, InvalidRestoredPlanFailsWithoutRetry) {
  auto id = submit("general");
  Plan cyclic{PlanId("cyclic"), id,
              {make_step("a", ActionKind::LlmCall, {}, {step_id("b")}),
               make_step("b", ActionKind::LlmCall, {}, {step_id("a")})}};
  ASSERT_TRUE(plans_.save(cyclic).has_value());
  auto claimed = tasks_.claim(WorkerId("w0"));
  ASSERT_TRUE(claimed.has_value() && claimed->has_value());
  ASSERT_TRUE(tasks_.update_step(id, cyclic.id(), std::nullopt).has_value());
  ASSERT_TRUE(tasks_.fail(id, "worker restarted").has_value());
  ASSERT_EQ(task(id).status, TaskStatus::Queued);
  auto executor = make_executor();

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Failed);
  EXPECT_EQ(t.attempts, 2);
  ASSERT_TRUE(t.error.has_value());
  EXPECT_TRUE(t.error->starts_with("Restored plan cyclic is invalid")) << *t.error;
  EXPECT_EQ(llm_->calls(), 0);
}

TEST_F(ExecutorTest, FailedStepIsRetriedOnNextAttempt) {
  auto flaky = std::make_shared<FunctionHandler>([n = 0](const ActionRequest&) mutable -> HandlerResult {
    if (n++ == 0) {
      return StepError{"search backend unavailable"};
    }
    return StepCompleted{.result = {{"hits", 3}}, .skip = {}};
  });
  registry_.register_handler(ActionKind::ToolCall, flaky);
  auto id = submit("research");
  auto executor = make_executor();

  run_once(*executor);

  auto retried = task(id);
  EXPECT_EQ(retried.status, TaskStatus::Queued);
  EXPECT_EQ(retried.error, "search backend unavailable");
  EXPECT_EQ(count_of(event_types(id), "step_failed"), 1);

  run_once(*executor);

  auto done = task(id);
  EXPECT_EQ(done.status, TaskStatus::Succeeded);
  EXPECT_EQ(done.attempts, 2);
  EXPECT_EQ(flaky->calls(), 2);
  EXPECT_EQ(llm_->calls(), 2);
}

TEST_F(ExecutorTest, FailureExhaustsAttempts) {
  registry_.register_handler(
      ActionKind::LlmCall, std::make_shared<FunctionHandler>([](const ActionRequest&) -> HandlerResult {
        return StepError{"model overloaded"};
      }));
  auto id = tasks_.enqueue(7, "general", EnqueueOptions{.max_attempts = 2});
  ASSERT_TRUE(id.has_value());
  auto executor = make_executor();

  run_once(*executor);
  EXPECT_EQ(task(*id).status, TaskStatus::Queued);
  run_once(*executor);

  auto t = task(*id);
  EXPECT_EQ(t.status, TaskStatus::Failed);
  EXPECT_EQ(t.attempts, 2);
  EXPECT_EQ(t.error, "model overloaded");
}

TEST_F(ExecutorTest, MissingHandlerFailsImmediately) {
  HandlerRegistry bare = make_builtin_registry();
  StepExecutor steps{bare, tasks_, 0ms};
  Executor executor(tasks_, planner_, plans_, steps, ExecutorOptions{.worker_id = WorkerId("w2")});
  auto id = submit("general");

  ASSERT_TRUE(executor.process_one().has_value());

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Failed);
  EXPECT_EQ(t.attempts, 1);
  EXPECT_EQ(t.error, "No handler registered for action llm_call");
}

TEST_F(ExecutorTest, InvalidPlanFailsWithoutRetry) {
  planner_.register_strategy("broken", [](const PlanRequest&) {
    return std::vector<Step>{make_step("a", ActionKind::LlmCall, {}, {step_id("b")}),
                             make_step("b", ActionKind::LlmCall, {}, {step_id("a")})};
  });
  auto id = submit("broken");
  auto executor = make_executor();

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Failed);
  EXPECT_EQ(t.attempts, 1);
  ASSERT_TRUE(t.error.has_value());
  EXPECT_TRUE(t.error->starts_with("Invalid plan for kind 'broken'"));
  EXPECT_EQ(llm_->calls(), 0);
}

TEST_F(ExecutorTest, CancelDuringRunAbandonsTask) {
  TaskId id = 0;
  registry_.register_handler(
      ActionKind::LlmCall,
      std::make_shared<FunctionHandler>([this, &id](const ActionRequest&) -> HandlerResult {
        EXPECT_TRUE(tasks_.cancel(id).has_value());
        return StepCompleted{.result = "done", .skip = {}};
      }));
  id = submit("general");
  auto executor = make_executor();

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Cancelled);
  EXPECT_EQ(t.error, "user_cancelled");
  auto types = event_types(id);
  EXPECT_EQ(count_of(types, "step_started"), 1);
  EXPECT_EQ(count_of(types, "succeeded"), 0);
}

TEST_F(ExecutorTest, ConditionBranchSkipsSteps) {
  planner_.register_strategy("branch", [](const PlanRequest&) {
    return std::vector<Step>{
        make_step("score", ActionKind::ToolCall, {{"tool", "score"}}),
        make_step("check", ActionKind::Condition,
                  {{"condition", "result.echo == \"score\""},
                   {"source_step_id", "score"},
                   {"skip_on_true", {"slow"}}},
                  {step_id("score")}),
        make_step("slow", ActionKind::LlmCall, {{"purpose", "slow"}}, {step_id("check")}),
        make_step("fast", ActionKind::LlmCall, {{"purpose", "fast"}}, {step_id("check")}),
    };
  });
  auto id = submit("branch");
  auto executor = make_executor();

  run_once(*executor);

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Succeeded);
  EXPECT_EQ(llm_->calls(), 1);
  EXPECT_EQ(t.result["primary_output"]["echo"], "fast");
  EXPECT_EQ(t.result["step_results"]["check"]["branch"], "true");
}

TEST_F(ExecutorTest, BackgroundWorkerDrainsQueue) {
  auto first = submit("general", "one");
  auto second = submit("research", "two");
  auto executor = make_executor();

  executor->start();
  EXPECT_TRUE(executor->is_running());
  for (int i = 0; i < 500; ++i) {
    if (task(first).status == TaskStatus::Succeeded &&
        task(second).status == TaskStatus::Succeeded) {
      break;
    }
    test::sleep_ms(10ms);
  }
  executor->stop();

  EXPECT_FALSE(executor->is_running());
  EXPECT_EQ(task(first).status, TaskStatus::Succeeded);
  EXPECT_EQ(task(second).status, TaskStatus::Succeeded);
}

// A worker died mid-step; once its lease lapses another worker restores the
// plan, keeps finished results and re-runs the interrupted step.
TEST_F(ExecutorTest, RecoversPlanAfterWorkerCrash) {
  TaskManager short_lease{db_, TaskManagerOptions{.lease_timeout = 1ms}};
  auto id = submit("research", "crash");

  auto claimed = short_lease.claim(WorkerId("dead"));
  ASSERT_TRUE(claimed.has_value());
  ASSERT_TRUE(claimed->has_value());
  auto plan = planner_.build(id, "research", "crash", nlohmann::json::object());
  auto& steps = plan.steps();
  steps[0].status = StepStatus::Completed;
  steps[0].result = {{"hits", 12}};
  steps[1].status = StepStatus::Running;
  ASSERT_TRUE(plans_.save(plan).has_value());
  ASSERT_TRUE(short_lease.update_step(id, plan.id(), steps[1].step_id).has_value());
  test::sleep_ms(5ms);

  StepExecutor step_executor{registry_, short_lease, 0ms};
  Executor survivor(short_lease, planner_, plans_, step_executor,
                    ExecutorOptions{.worker_id = WorkerId("survivor")});
  auto processed = survivor.process_one();
  ASSERT_TRUE(processed.has_value());
  ASSERT_EQ(*processed, std::optional<TaskId>{id});

  auto t = task(id);
  EXPECT_EQ(t.status, TaskStatus::Succeeded);
  EXPECT_EQ(t.attempts, 2);
  EXPECT_EQ(tool_->calls(), 0);
  EXPECT_EQ(llm_->calls(), 2);
  EXPECT_EQ(t.result["step_results"][steps[0].step_id.str()]["hits"], 12);
}
