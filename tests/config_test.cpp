#include "stepflow/app/application.hpp"
#include "stepflow/config/config.hpp"

#include "test_utils.hpp"

#include <fstream>

#include "gtest/gtest.h"

using namespace stepflow;

TEST(ConfigTest, SystemConfigDefaults) {
  SystemConfig config;

  EXPECT_EQ(config.storage.db_file, "stepflow.db");
  EXPECT_EQ(config.storage.snapshot_dir, "./snapshots");
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.logging.file.empty());
  EXPECT_EQ(config.worker.count, 1);
  EXPECT_FALSE(config.worker.dry_run);
  EXPECT_EQ(config.limits.max_steps, 20);
  EXPECT_EQ(config.limits.max_wall_time_sec, 300);
  EXPECT_EQ(config.limits.lease_timeout_sec, 300);
  EXPECT_EQ(config.limits.max_attempts, 3);
  EXPECT_EQ(config.limits.max_queued_per_owner, 10);
  EXPECT_EQ(config.limits.max_active_per_owner, 3);
  EXPECT_EQ(config.limits.max_tasks_per_hour, 100);
  EXPECT_EQ(config.retention.event_retention_days, 30);
  EXPECT_TRUE(ConfigLoader::validate(config).has_value());
}

TEST(ConfigTest, LoadFullYaml) {
  auto config = ConfigLoader::load_from_string(R"(
storage:
  db_file: /var/lib/stepflow/tasks.db
  snapshot_dir: /var/lib/stepflow/snapshots
  busy_timeout_ms: 2000
logging:
  level: debug
  file: /var/log/stepflow.log
worker:
  count: 4
  poll_interval_ms: 250
  id_prefix: node-a
  dry_run: true
limits:
  max_steps: 50
  max_wall_time_sec: 600
  handler_timeout_sec: 30
  lease_timeout_sec: 120
  max_attempts: 5
  max_queued_per_owner: 20
  max_active_per_owner: 2
  max_tasks_per_hour: 40
retention:
  event_retention_days: 7
)");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->storage.db_file, "/var/lib/stepflow/tasks.db");
  EXPECT_EQ(config->storage.snapshot_dir, "/var/lib/stepflow/snapshots");
  EXPECT_EQ(config->storage.busy_timeout_ms, 2000);
  EXPECT_EQ(config->logging.level, "debug");
  EXPECT_EQ(config->logging.file, "/var/log/stepflow.log");
  EXPECT_EQ(config->worker.count, 4);
  EXPECT_EQ(config->worker.poll_interval_ms, 250);
  EXPECT_EQ(config->worker.id_prefix, "node-a");
  EXPECT_TRUE(config->worker.dry_run);
  EXPECT_EQ(config->limits.max_steps, 50);
  EXPECT_EQ(config->limits.handler_timeout_sec, 30);
  EXPECT_EQ(config->limits.max_tasks_per_hour, 40);
  EXPECT_EQ(config->retention.event_retention_days, 7);

  auto opts = task_manager_options(*config);
  EXPECT_EQ(opts.lease_timeout, std::chrono::seconds(120));
  EXPECT_EQ(opts.max_attempts, 5);
  EXPECT_EQ(opts.max_queued_per_owner, 20);
  EXPECT_EQ(opts.max_active_per_owner, 2);

  auto limits = execution_limits(*config);
  EXPECT_EQ(limits.max_steps, 50);
  EXPECT_EQ(limits.max_wall_time, std::chrono::seconds(600));
}

TEST(ConfigTest, PartialYamlKeepsDefaults) {
  auto config = ConfigLoader::load_from_string(R"(
limits:
  max_steps: 5
)");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->limits.max_steps, 5);
  EXPECT_EQ(config->limits.max_attempts, 3);
  EXPECT_EQ(config->worker.count, 1);
  EXPECT_EQ(config->storage.db_file, "stepflow.db");
}

TEST(ConfigTest, RejectsNonPositiveLimits) {
  auto zero_steps = ConfigLoader::load_from_string("limits:\n  max_steps: 0\n");
  ASSERT_FALSE(zero_steps.has_value());
  EXPECT_EQ(zero_steps.error(), Error::InvalidArgument);

  auto no_workers = ConfigLoader::load_from_string("worker:\n  count: -1\n");
  ASSERT_FALSE(no_workers.has_value());
  EXPECT_EQ(no_workers.error(), Error::InvalidArgument);

  auto empty_db = ConfigLoader::load_from_string("storage:\n  db_file: \"\"\n");
  ASSERT_FALSE(empty_db.has_value());
  EXPECT_EQ(empty_db.error(), Error::InvalidArgument);
}

TEST(ConfigTest, ZeroHandlerTimeoutIsAllowed) {
  auto config = ConfigLoader::load_from_string("limits:\n  handler_timeout_sec: 0\n");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->limits.handler_timeout_sec, 0);
}

TEST(ConfigTest, HandlerTimeoutMustBeShorterThanLease) {
  auto longer = ConfigLoader::load_from_string(
      "limits:\n  handler_timeout_sec: 600\n  lease_timeout_sec: 300\n");
  ASSERT_FALSE(longer.has_value());
  EXPECT_EQ(longer.error(), Error::InvalidArgument);

  auto equal = ConfigLoader::load_from_string(
      "limits:\n  handler_timeout_sec: 300\n  lease_timeout_sec: 300\n");
  ASSERT_FALSE(equal.has_value());
  EXPECT_EQ(equal.error(), Error::InvalidArgument);

  auto shorter = ConfigLoader::load_from_string(
      "limits:\n  handler_timeout_sec: 299\n  lease_timeout_sec: 300\n");
  EXPECT_TRUE(shorter.has_value());

  SystemConfig inline_handlers;
  inline_handlers.limits.handler_timeout_sec = 0;
  inline_handlers.limits.lease_timeout_sec = 1;
  EXPECT_TRUE(ConfigLoader::validate(inline_handlers).has_value());
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  auto bad_syntax = ConfigLoader::load_from_string("limits: [max_steps: 1");
  ASSERT_FALSE(bad_syntax.has_value());
  EXPECT_EQ(bad_syntax.error(), Error::ParseError);

  auto wrong_type = ConfigLoader::load_from_string("limits:\n  max_steps: many\n");
  ASSERT_FALSE(wrong_type.has_value());
  EXPECT_EQ(wrong_type.error(), Error::ParseError);

  auto not_a_map = ConfigLoader::load_from_string("storage: 5\n");
  ASSERT_FALSE(not_a_map.has_value());
  EXPECT_EQ(not_a_map.error(), Error::ParseError);

  auto empty = ConfigLoader::load_from_string("");
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), Error::ParseError);
}

TEST(ConfigTest, LoadFromFile) {
  test::TempDir dir;
  auto path = (dir.path() / "stepflow.yaml").string();
  {
    std::ofstream out(path);
    out << "worker:\n  count: 2\n  id_prefix: batch\n";
  }

  auto config = ConfigLoader::load_from_file(path);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->worker.count, 2);
  EXPECT_EQ(config->worker.id_prefix, "batch");
}

TEST(ConfigTest, MissingFileIsFileNotFound) {
  auto config = ConfigLoader::load_from_file("/nonexistent/stepflow.yaml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::FileNotFound);
}

// A dry-run application drains the queue with no-op handlers.
TEST(ApplicationTest, DryRunWorkersCompleteTasks) {
  test::TempDir dir;
  SystemConfig config;
  config.storage.db_file = dir.db_path();
  config.storage.snapshot_dir = dir.snapshot_dir().string();
  config.worker.count = 2;
  config.worker.poll_interval_ms = 10;
  config.worker.dry_run = true;

  Application app(config);
  ASSERT_TRUE(app.init().has_value());
  EXPECT_FALSE(app.is_running());

  auto research = app.tasks().enqueue(
      1, "research", EnqueueOptions{.input_text = "fusion"});
  auto general = app.tasks().enqueue(
      2, "general", EnqueueOptions{.input_text = "plan a trip"});
  ASSERT_TRUE(research.has_value());
  ASSERT_TRUE(general.has_value());

  ASSERT_TRUE(app.start().has_value());
  EXPECT_TRUE(app.is_running());

  auto finished = [&] {
    auto a = app.tasks().get_task(*research);
    auto b = app.tasks().get_task(*general);
    return a && b && a->status == TaskStatus::Succeeded &&
           b->status == TaskStatus::Succeeded;
  };
  for (int i = 0; i < 500 && !finished(); ++i) {
    test::sleep_ms(std::chrono::milliseconds(10));
  }
  app.stop();

  EXPECT_FALSE(app.is_running());
  ASSERT_TRUE(finished());
  auto task = app.tasks().get_task(*research);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->result["primary_output"]["noop"], true);
  EXPECT_EQ(task->result["primary_output"]["action"], "llm_call");
}

TEST(ApplicationTest, ApprovalWithoutInitFails) {
  Application app(SystemConfig{});
  auto r = app.handle_approval(1, true);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
}
