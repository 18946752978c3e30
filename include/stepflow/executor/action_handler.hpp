#pragma once

#include "stepflow/core/cancellation.hpp"
#include "stepflow/plan/step.hpp"
#include "stepflow/plan/step_results.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace stepflow {

// Everything a handler may read. Copied per call so a handler that outlives
// its deadline never touches executor state.
struct ActionRequest {
  TaskId task_id{0};
  OwnerId owner_id{0};
  StepId step_id;
  ActionKind action{ActionKind::LlmCall};
  nlohmann::json params = nlohmann::json::object();
  std::string input_text;
  nlohmann::json input_data = nlohmann::json::object();
  StepResults step_results;
  CancellationToken cancel;
};

struct StepCompleted {
  nlohmann::json result;
  // Pending steps to mark skipped (branches not taken).
  std::vector<StepId> skip;
};

// Execution must stop until a human decides; not an error.
struct ApprovalRequired {
  std::string message;
  StepId step_id;
  std::optional<std::string> draft;
};

struct StepError {
  std::string message;
};

using HandlerResult = std::variant<StepCompleted, ApprovalRequired, StepError>;

// Handlers must be idempotent: a step interrupted by a crash runs again.
class IActionHandler {
public:
  virtual ~IActionHandler() = default;

  [[nodiscard]] virtual auto execute(const ActionRequest& request)
      -> HandlerResult = 0;
};

class HandlerRegistry {
public:
  auto register_handler(ActionKind kind, std::shared_ptr<IActionHandler> handler)
      -> void {
    handlers_.insert_or_assign(kind, std::move(handler));
  }

  [[nodiscard]] auto find(ActionKind kind) const
      -> std::shared_ptr<IActionHandler> {
    auto it = handlers_.find(kind);
    return it != handlers_.end() ? it->second : nullptr;
  }

  [[nodiscard]] auto contains(ActionKind kind) const -> bool {
    return handlers_.contains(kind);
  }

private:
  std::unordered_map<ActionKind, std::shared_ptr<IActionHandler>> handlers_;
};

}  // namespace stepflow
