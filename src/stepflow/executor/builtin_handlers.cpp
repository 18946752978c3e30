#include "stepflow/executor/builtin_handlers.hpp"

#include "stepflow/condition/condition_evaluator.hpp"
#include "stepflow/storage/state_strings.hpp"
#include "stepflow/util/log.hpp"

#include <format>

namespace stepflow {

namespace {

auto optional_step_id(const nlohmann::json& params, const char* key)
    -> std::optional<StepId> {
  if (auto it = params.find(key); it != params.end() && it->is_string()) {
    return StepId{it->get<std::string>()};
  }
  return std::nullopt;
}

auto step_id_list(const nlohmann::json& params, const char* key)
    -> std::vector<StepId> {
  std::vector<StepId> ids;
  if (auto it = params.find(key); it != params.end() && it->is_array()) {
    for (const auto& id : *it) {
      if (id.is_string()) {
        ids.emplace_back(id.get<std::string>());
      }
    }
  }
  return ids;
}

}  // namespace

auto extract_draft(const nlohmann::json& draft_result)
    -> std::optional<std::string> {
  if (draft_result.is_string()) {
    return draft_result.get<std::string>();
  }
  if (!draft_result.is_object()) {
    return std::nullopt;
  }
  if (auto it = draft_result.find("error"); it != draft_result.end() && !it->is_null()) {
    return std::format("Error: {}", it->is_string() ? it->get<std::string>() : it->dump());
  }
  if (auto it = draft_result.find("response"); it != draft_result.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return std::nullopt;
}

auto ApprovalHandler::execute(const ActionRequest& request) -> HandlerResult {
  ApprovalRequired approval;
  approval.step_id = request.step_id;
  approval.message = request.params.value("message", std::string{kDefaultMessage});

  if (auto draft_id = optional_step_id(request.params, "draft_step_id")) {
    if (const auto* result = request.step_results.find(*draft_id)) {
      approval.draft = extract_draft(*result);
    } else {
      log::warn("Approval step {} references draft step {} with no result",
                request.step_id, *draft_id);
    }
  }
  return approval;
}

auto ConditionHandler::execute(const ActionRequest& request) -> HandlerResult {
  auto condition = request.params.value("condition", std::string{});
  auto source = optional_step_id(request.params, "source_step_id");

  auto value = ConditionEvaluator::evaluate(condition, request.step_results, source);
  if (!value) {
    return StepError{std::format("Condition error: {}", value.error().message)};
  }

  StepCompleted done;
  done.result = {
      {"condition", condition},
      {"result", *value},
      {"branch", *value ? "true" : "false"},
  };
  done.skip = step_id_list(request.params, *value ? "skip_on_true" : "skip_on_false");
  return done;
}

auto AggregateHandler::execute(const ActionRequest& request) -> HandlerResult {
  auto ids = step_id_list(request.params, "step_ids");
  if (ids.empty()) {
    ids = request.step_results.order();
  }

  auto aggregated = nlohmann::json::object();
  for (const auto& id : ids) {
    if (const auto* result = request.step_results.find(id)) {
      aggregated[id.str()] = *result;
    }
  }
  auto count = aggregated.size();
  return StepCompleted{
      .result = {{"aggregated", std::move(aggregated)}, {"count", count}},
      .skip = {},
  };
}

auto NoopHandler::execute(const ActionRequest& request) -> HandlerResult {
  return StepCompleted{
      .result = {{"action", action_kind_name(request.action)},
                 {"params", request.params},
                 {"noop", true}},
      .skip = {},
  };
}

auto make_builtin_registry(bool dry_run) -> HandlerRegistry {
  HandlerRegistry registry;
  registry.register_handler(ActionKind::Approval, std::make_shared<ApprovalHandler>());
  registry.register_handler(ActionKind::Condition, std::make_shared<ConditionHandler>());
  registry.register_handler(ActionKind::Aggregate, std::make_shared<AggregateHandler>());
  if (dry_run) {
    auto noop = std::make_shared<NoopHandler>();
    registry.register_handler(ActionKind::LlmCall, noop);
    registry.register_handler(ActionKind::ToolCall, noop);
  }
  return registry;
}

}  // namespace stepflow
