#include "stepflow/app/application.hpp"
#include "stepflow/cli/commands.hpp"
#include "stepflow/storage/state_strings.hpp"

#include <chrono>
#include <format>
#include <print>

namespace stepflow::cli {

namespace {

auto format_time(std::chrono::system_clock::time_point t) -> std::string {
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(t));
}

auto print_task(const Task& t) -> void {
  std::println("Task:     {}", t.id);
  std::println("Owner:    {}", t.owner_id);
  std::println("Kind:     {}", t.kind);
  if (t.pause_reason) {
    std::println("Status:   {} ({})", task_status_name(t.status),
                 pause_reason_name(*t.pause_reason));
  } else {
    std::println("Status:   {}", task_status_name(t.status));
  }
  std::println("Attempts: {}/{}", t.attempts, t.max_attempts);
  if (t.locked_by) {
    std::println("Worker:   {}", *t.locked_by);
  }
  if (t.current_plan_id) {
    std::println("Plan:     {}", *t.current_plan_id);
  }
  if (t.current_step_id) {
    std::println("Step:     {}", *t.current_step_id);
  }
  std::println("Created:  {}", format_time(t.created_at));
  if (t.started_at) {
    std::println("Started:  {}", format_time(*t.started_at));
  }
  if (t.completed_at) {
    std::println("Finished: {}", format_time(*t.completed_at));
  }
  if (t.error) {
    std::println("Error:    {}", *t.error);
  }
  if (!t.result.is_null()) {
    std::println("Result:   {}", t.result.dump(2));
  }
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Failed to open database: {}", r.error().message());
    return 1;
  }

  if (opts.task_id) {
    auto task = app.tasks().get_task(*opts.task_id);
    if (!task) {
      std::println(stderr, "Error: Task not found: {}", *opts.task_id);
      return 1;
    }
    print_task(*task);
    return 0;
  }

  if (!opts.owner) {
    auto size = app.tasks().get_queue_size();
    if (!size) {
      std::println(stderr, "Error: {}", size.error().message());
      return 1;
    }
    std::println("Queued tasks: {}", *size);
    return 0;
  }

  auto tasks = app.tasks().get_owner_tasks(*opts.owner);
  if (!tasks) {
    std::println(stderr, "Error: {}", tasks.error().message());
    return 1;
  }
  if (auto limits = app.tasks().get_owner_limits(*opts.owner); limits) {
    std::println("Quota: queued {}/{}, active {}/{}, last hour {}/{}\n",
                 limits->queued.used, limits->queued.limit,
                 limits->active.used, limits->active.limit,
                 limits->per_hour.used, limits->per_hour.limit);
  }
  if (tasks->empty()) {
    std::println("No tasks found.");
    return 0;
  }

  std::println("{:<8} {:<12} {:<10} {:<9} {:<20}", "ID", "KIND", "STATUS",
               "ATTEMPTS", "CREATED");
  for (const auto& t : *tasks) {
    std::println("{:<8} {:<12} {:<10} {:<9} {:<20}", t.id, t.kind,
                 task_status_name(t.status),
                 std::format("{}/{}", t.attempts, t.max_attempts),
                 format_time(t.created_at));
  }
  return 0;
}

auto cmd_events(const EventsOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Failed to open database: {}", r.error().message());
    return 1;
  }

  auto events = app.tasks().get_task_events(opts.task_id, opts.limit);
  if (!events) {
    std::println(stderr, "Error: {}", events.error().message());
    return 1;
  }
  if (events->empty()) {
    std::println("No events for task {}.", opts.task_id);
    return 0;
  }

  std::println("{:<20} {:<18} {:<14} {}", "TIME", "EVENT", "STEP", "DATA");
  for (const auto& e : *events) {
    std::println("{:<20} {:<18} {:<14} {}", format_time(e.created_at),
                 e.event_type, e.step_id ? e.step_id->str() : "-",
                 e.data.dump());
  }
  return 0;
}

}  // namespace stepflow::cli
