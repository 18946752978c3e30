#include "stepflow/app/application.hpp"
#include "stepflow/cli/commands.hpp"

#include <print>

namespace stepflow::cli {

namespace {

template <typename Fn>
auto with_app(const CommonOptions& common, Fn&& fn) -> int {
  auto config = load_config(common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Failed to open database: {}", r.error().message());
    return 1;
  }
  return fn(app);
}

}  // namespace

auto cmd_approve(const ApprovalOptions& opts) -> int {
  return with_app(opts.common, [&](Application& app) {
    if (auto r = app.handle_approval(opts.task_id, true, opts.content); !r) {
      std::println(stderr, "Error: Cannot approve task {}: {}", opts.task_id,
                   r.error().message());
      return 1;
    }
    std::println("Task {} approved and requeued", opts.task_id);
    return 0;
  });
}

auto cmd_reject(const TaskOptions& opts) -> int {
  return with_app(opts.common, [&](Application& app) {
    if (auto r = app.handle_approval(opts.task_id, false); !r) {
      std::println(stderr, "Error: Cannot reject task {}: {}", opts.task_id,
                   r.error().message());
      return 1;
    }
    std::println("Task {} rejected", opts.task_id);
    return 0;
  });
}

auto cmd_resume(const TaskOptions& opts) -> int {
  return with_app(opts.common, [&](Application& app) {
    if (auto r = app.tasks().resume(opts.task_id); !r) {
      std::println(stderr, "Error: Cannot resume task {}: {}", opts.task_id,
                   r.error().message());
      return 1;
    }
    std::println("Task {} resumed", opts.task_id);
    return 0;
  });
}

auto cmd_cancel(const TaskOptions& opts) -> int {
  return with_app(opts.common, [&](Application& app) {
    auto reason = opts.reason.empty() ? "user_cancelled" : opts.reason;
    auto r = app.tasks().cancel(opts.task_id, reason);
    if (!r) {
      std::println(stderr, "Error: Cannot cancel task {}: {}", opts.task_id,
                   r.error().message());
      return 1;
    }
    if (!*r) {
      std::println("Task {} already finished", opts.task_id);
      return 0;
    }
    std::println("Task {} cancelled", opts.task_id);
    return 0;
  });
}

}  // namespace stepflow::cli
