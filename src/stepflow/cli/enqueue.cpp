#include "stepflow/app/application.hpp"
#include "stepflow/cli/commands.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace stepflow::cli {

auto cmd_enqueue(const SubmitOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  EnqueueOptions enqueue{
      .input_text = opts.input_text,
      .max_attempts = opts.max_attempts,
      .skip_limits = opts.skip_limits,
  };
  if (!opts.input_json.empty()) {
    auto data = nlohmann::json::parse(opts.input_json, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
      std::println(stderr, "Error: --data must be a JSON object");
      return 1;
    }
    enqueue.input_data = std::move(data);
  }

  Application app(std::move(*config));
  if (auto r = app.init(); !r) {
    std::println(stderr, "Error: Failed to open database: {}", r.error().message());
    return 1;
  }

  auto id = app.tasks().enqueue(opts.owner, opts.kind, std::move(enqueue));
  if (!id) {
    std::println(stderr, "Error: {}", id.error().message);
    return 1;
  }
  std::println("Task {} queued ({})", *id, opts.kind);
  return 0;
}

}  // namespace stepflow::cli
