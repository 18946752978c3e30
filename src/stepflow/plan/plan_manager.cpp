#include "stepflow/plan/plan_manager.hpp"

#include "stepflow/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <type_traits>

namespace stepflow {

namespace {

auto make_step(ActionKind action, nlohmann::json params,
               std::vector<StepId> depends_on = {}) -> Step {
  Step step;
  step.step_id = generate_step_id();
  step.action = action;
  step.params = std::move(params);
  step.depends_on = std::move(depends_on);
  return step;
}

// Optional field of the structured input. Absent or mistyped fields give the
// fallback; user input never makes a strategy throw.
template <typename T>
auto field_or(const nlohmann::json& data, const char* key, T fallback) -> T {
  if (!data.is_object()) {
    return fallback;
  }
  auto it = data.find(key);
  if (it == data.end()) {
    return fallback;
  }
  if constexpr (std::is_same_v<T, std::string>) {
    return it->is_string() ? it->get<std::string>() : fallback;
  } else if constexpr (std::is_same_v<T, bool>) {
    return it->is_boolean() ? it->get<bool>() : fallback;
  } else if constexpr (std::is_integral_v<T>) {
    return it->is_number_integer() ? it->get<T>() : fallback;
  } else {
    return it->is_number() ? it->get<T>() : fallback;
  }
}

// Prefers the free-form input, then the named field of the structured input.
auto text_or(const PlanRequest& req, const char* field) -> std::string {
  if (!req.input_text.empty()) {
    return std::string(req.input_text);
  }
  return field_or(req.input_data, field, std::string{});
}

auto plan_general(const PlanRequest& req) -> std::vector<Step> {
  auto text = std::string(req.input_text);
  return {
      make_step(ActionKind::LlmCall, {{"purpose", "analyze"}, {"input_text", text}}),
      make_step(ActionKind::LlmCall, {{"purpose", "execute"}, {"input_text", text}}),
  };
}

auto plan_research(const PlanRequest& req) -> std::vector<Step> {
  auto search = make_step(ActionKind::ToolCall,
                          {{"tool", "web_search"}, {"query", std::string(req.input_text)}});
  auto analyze = make_step(ActionKind::LlmCall,
                           {{"purpose", "analyze_sources"},
                            {"search_step_id", search.step_id.str()}},
                           {search.step_id});
  auto synthesize = make_step(ActionKind::LlmCall,
                              {{"purpose", "synthesize"},
                               {"analysis_step_id", analyze.step_id.str()}},
                              {analyze.step_id});
  return {std::move(search), std::move(analyze), std::move(synthesize)};
}

auto plan_summary(const PlanRequest& req) -> std::vector<Step> {
  auto url = field_or(req.input_data, "url", std::string{});
  if (url.empty()) {
    return {make_step(ActionKind::LlmCall, {{"purpose", "summarize"},
                                            {"input_text", std::string(req.input_text)}})};
  }
  auto fetch = make_step(ActionKind::ToolCall, {{"tool", "web_fetch"}, {"url", url}});
  auto summarize = make_step(ActionKind::LlmCall,
                             {{"purpose", "summarize"},
                              {"content_step_id", fetch.step_id.str()}},
                             {fetch.step_id});
  return {std::move(fetch), std::move(summarize)};
}

// Drafts content from memory and (optionally) web context, then waits for a
// human to approve the draft.
auto plan_generate(const PlanRequest& req) -> std::vector<Step> {
  auto topic = text_or(req, "topic");
  auto owner = field_or(req.input_data, "owner_id", std::int64_t{0});
  auto context = field_or(req.input_data, "context", std::string{});
  auto temperature = field_or(req.input_data, "temperature", 0.5);

  std::vector<Step> steps;
  auto memory = make_step(ActionKind::ToolCall, {{"tool", "memory_search"},
                                                 {"owner_id", owner},
                                                 {"query", topic},
                                                 {"limit", 5}});
  std::vector<StepId> context_steps{memory.step_id};
  steps.push_back(std::move(memory));

  if (!field_or(req.input_data, "skip_web_search", false)) {
    auto web = make_step(ActionKind::ToolCall,
                         {{"tool", "web_search"}, {"query", topic}, {"limit", 5}});
    context_steps.push_back(web.step_id);
    steps.push_back(std::move(web));
  }

  auto draft = make_step(ActionKind::LlmCall, {{"purpose", "generate_draft"},
                                               {"input_text", topic},
                                               {"context", context},
                                               {"owner_id", owner},
                                               {"temperature", temperature}},
                         std::move(context_steps));
  auto approval = make_step(ActionKind::Approval,
                            {{"message", "Review the draft"},
                             {"draft_step_id", draft.step_id.str()}},
                            {draft.step_id});
  steps.push_back(std::move(draft));
  steps.push_back(std::move(approval));
  return steps;
}

// Targeted edit: the edit intent is parsed by a tool, only the new fragment is
// generated, and a tool applies the operations to the original text.
auto plan_edit(const PlanRequest& req) -> std::vector<Step> {
  auto request = text_or(req, "edit_request");
  auto original = field_or(req.input_data, "original_text", std::string{});
  auto topic = field_or(req.input_data, "topic", std::string{});
  auto owner = field_or(req.input_data, "owner_id", std::int64_t{0});

  auto parse = make_step(ActionKind::ToolCall, {{"tool", "parse_edit_intent"},
                                                {"edit_request", request},
                                                {"original_text", original}});
  auto memory = make_step(ActionKind::ToolCall,
                          {{"tool", "memory_search"},
                           {"owner_id", owner},
                           {"query", std::format("style {}", topic)},
                           {"limit", 3}},
                          {parse.step_id});
  auto web = make_step(ActionKind::ToolCall,
                       {{"tool", "web_search"}, {"query", topic}, {"limit", 3}},
                       {parse.step_id});
  auto generate = make_step(ActionKind::LlmCall,
                            {{"purpose", "generate_edit_content"},
                             {"owner_id", owner},
                             {"topic", topic}},
                            {parse.step_id, memory.step_id, web.step_id});
  auto apply = make_step(ActionKind::ToolCall, {{"tool", "apply_edit_operations"},
                                                {"original_text", original},
                                                {"owner_id", owner}},
                         {parse.step_id, generate.step_id});
  return {std::move(parse), std::move(memory), std::move(web),
          std::move(generate), std::move(apply)};
}

auto plan_analyze(const PlanRequest& req) -> std::vector<Step> {
  auto source = text_or(req, "source");
  auto owner = field_or(req.input_data, "owner_id", std::int64_t{0});

  auto fetch = make_step(ActionKind::ToolCall, {{"tool", "fetch_source"},
                                                {"source", source},
                                                {"limit", 20}});
  auto metrics = make_step(ActionKind::ToolCall,
                           {{"tool", "compute_metrics"},
                            {"source_step_id", fetch.step_id.str()}},
                           {fetch.step_id});
  auto analyze = make_step(ActionKind::LlmCall, {{"purpose", "deep_analyze"},
                                                 {"input_text", source},
                                                 {"owner_id", owner}},
                           {fetch.step_id, metrics.step_id});
  auto store = make_step(ActionKind::ToolCall, {{"tool", "memory_store"},
                                                {"owner_id", owner},
                                                {"memory_type", "context"},
                                                {"importance", 0.85},
                                                {"source_step_id", analyze.step_id.str()}},
                         {analyze.step_id});
  return {std::move(fetch), std::move(metrics), std::move(analyze),
          std::move(store)};
}

}  // namespace

PlanManager::PlanManager() {
  register_strategy(std::string(kDefaultKind), plan_general);
  register_strategy("research", plan_research);
  register_strategy("summary", plan_summary);
  register_strategy("generate", plan_generate);
  register_strategy("edit", plan_edit);
  register_strategy("analyze", plan_analyze);
}

auto PlanManager::register_strategy(std::string kind, PlanStrategy strategy)
    -> void {
  strategies_.insert_or_assign(std::move(kind), std::move(strategy));
}

auto PlanManager::has_strategy(std::string_view kind) const -> bool {
  return strategies_.find(kind) != strategies_.end();
}

auto PlanManager::kinds() const -> std::vector<std::string> {
  auto out = strategies_ | std::views::keys | std::ranges::to<std::vector>();
  std::ranges::sort(out);
  return out;
}

auto PlanManager::build(TaskId task_id, std::string_view kind,
                        std::string_view input_text,
                        const nlohmann::json& input_data) const -> Plan {
  auto it = strategies_.find(kind);
  if (it == strategies_.end()) {
    log::debug("No strategy for kind '{}', using {}", kind, kDefaultKind);
    it = strategies_.find(kDefaultKind);
  }

  static const nlohmann::json kEmpty = nlohmann::json::object();
  PlanRequest request{task_id, kind, input_text,
                      input_data.is_object() ? input_data : kEmpty};
  auto plan = Plan{generate_plan_id(), task_id, it->second(request)};
  log::info("Built plan {} for task {} ({} steps, kind={})", plan.id(), task_id,
            plan.size(), kind);
  return plan;
}

}  // namespace stepflow
