#pragma once

#include "stepflow/executor/action_handler.hpp"

#include <memory>
#include <optional>
#include <string>

namespace stepflow {

// Suspends with `message` and the draft produced by `draft_step_id`.
class ApprovalHandler : public IActionHandler {
public:
  static constexpr const char* kDefaultMessage = "Approval required";

  [[nodiscard]] auto execute(const ActionRequest& request)
      -> HandlerResult override;
};

// Evaluates `condition` against `source_step_id` (or the latest result).
// `skip_on_true` / `skip_on_false` name the steps of the branch not taken.
class ConditionHandler : public IActionHandler {
public:
  [[nodiscard]] auto execute(const ActionRequest& request)
      -> HandlerResult override;
};

// Collects the results of `step_ids`, or of every prior step when absent.
class AggregateHandler : public IActionHandler {
public:
  [[nodiscard]] auto execute(const ActionRequest& request)
      -> HandlerResult override;
};

// Stand-in for external llm/tool handlers in dry runs; echoes its input.
class NoopHandler : public IActionHandler {
public:
  [[nodiscard]] auto execute(const ActionRequest& request)
      -> HandlerResult override;
};

// Text shown to the approver for a draft step's result: its error when the
// step recorded one, else its `response` field, else a bare string result.
[[nodiscard]] auto extract_draft(const nlohmann::json& draft_result)
    -> std::optional<std::string>;

// Registry with the core handlers (approval, condition, aggregate). With
// dry_run, llm_call and tool_call are served by NoopHandler.
[[nodiscard]] auto make_builtin_registry(bool dry_run = false) -> HandlerRegistry;

}  // namespace stepflow
