#include "stepflow/plan/plan.hpp"

#include "stepflow/plan/dag.hpp"
#include "stepflow/storage/state_strings.hpp"
#include "stepflow/util/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace stepflow {

Plan::Plan(PlanId plan_id, TaskId task_id, std::vector<Step> steps)
    : plan_id_(std::move(plan_id)), task_id_(task_id), steps_(std::move(steps)) {
}

auto Plan::find_step(const StepId& step_id) -> Step* {
  auto it = std::ranges::find(steps_, step_id, &Step::step_id);
  return it != steps_.end() ? &*it : nullptr;
}

auto Plan::find_step(const StepId& step_id) const -> const Step* {
  auto it = std::ranges::find(steps_, step_id, &Step::step_id);
  return it != steps_.end() ? &*it : nullptr;
}

auto Plan::index_of(const StepId& step_id) const -> std::optional<std::size_t> {
  auto it = std::ranges::find(steps_, step_id, &Step::step_id);
  if (it == steps_.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::ranges::distance(steps_.begin(), it));
}

auto Plan::get_next_step() -> Step* {
  for (std::size_t i = 0; i < steps_.size(); ++i) {
    auto& step = steps_[i];
    if (step.status != StepStatus::Pending) {
      continue;
    }
    bool ready = std::ranges::all_of(step.depends_on, [this](const StepId& dep) {
      const auto* d = find_step(dep);
      return d != nullptr && is_settled(d->status);
    });
    if (ready) {
      current_step_index_ = i;
      return &step;
    }
  }
  return nullptr;
}

auto Plan::is_complete() const -> bool {
  return std::ranges::all_of(
      steps_, [](const Step& s) { return is_settled(s.status); });
}

auto Plan::has_failed() const -> bool {
  return std::ranges::any_of(
      steps_, [](const Step& s) { return s.status == StepStatus::Failed; });
}

auto Plan::validate() const -> Result<void> {
  DAG dag;
  for (const auto& step : steps_) {
    if (step.step_id.empty()) {
      log::warn("Plan {} has a step without an id", plan_id_);
      return fail(Error::InvalidArgument);
    }
    if (dag.has_node(step.step_id)) {
      log::warn("Plan {} has duplicate step id {}", plan_id_, step.step_id);
      return fail(Error::AlreadyExists);
    }
    dag.add_node(step.step_id);
  }

  for (const auto& step : steps_) {
    for (const auto& dep : step.depends_on) {
      if (!dag.has_node(dep)) {
        log::warn("Step {} depends on unknown step {}", step.step_id, dep);
        return fail(Error::NotFound);
      }
      if (auto r = dag.add_edge(dep, step.step_id); !r) {
        log::warn("Step {} dependency on {} creates a cycle", step.step_id, dep);
        return r;
      }
    }
  }
  return dag.is_valid();
}

auto step_to_json(const Step& step) -> nlohmann::json {
  nlohmann::json deps = nlohmann::json::array();
  for (const auto& dep : step.depends_on) {
    deps.push_back(dep.str());
  }
  return {
      {"step_id", step.step_id.str()},
      {"action", action_kind_name(step.action)},
      {"action_data", step.params},
      {"depends_on", std::move(deps)},
      {"status", step_status_name(step.status)},
      {"result", step.result},
      {"error", step.error ? nlohmann::json(*step.error) : nlohmann::json(nullptr)},
      {"snapshot_ref",
       step.snapshot_ref ? nlohmann::json(*step.snapshot_ref) : nlohmann::json(nullptr)},
  };
}

auto step_from_json(const nlohmann::json& j) -> Result<Step> {
  if (!j.is_object() || !j.contains("step_id") || !j["step_id"].is_string() ||
      !j.contains("action") || !j["action"].is_string()) {
    return fail(Error::ParseError);
  }

  Step step;
  step.step_id = StepId{j["step_id"].get<std::string>()};
  auto action = parse_action_kind(j["action"].get<std::string>());
  if (!action) {
    log::warn("Unknown action '{}' in step {}", j["action"].get<std::string>(),
              step.step_id);
    return fail(Error::ParseError);
  }
  step.action = *action;

  if (auto it = j.find("action_data"); it != j.end() && it->is_object()) {
    step.params = *it;
  }
  if (auto it = j.find("depends_on"); it != j.end() && it->is_array()) {
    for (const auto& dep : *it) {
      if (!dep.is_string()) {
        return fail(Error::ParseError);
      }
      step.depends_on.emplace_back(dep.get<std::string>());
    }
  }
  if (auto it = j.find("status"); it != j.end() && it->is_string()) {
    auto status = parse_step_status(it->get<std::string>());
    if (!status) {
      return fail(Error::ParseError);
    }
    step.status = *status;
  }
  if (auto it = j.find("result"); it != j.end()) {
    step.result = *it;
  }
  if (auto it = j.find("error"); it != j.end() && it->is_string()) {
    step.error = it->get<std::string>();
  }
  if (auto it = j.find("snapshot_ref"); it != j.end() && it->is_string()) {
    step.snapshot_ref = it->get<std::string>();
  }
  return step;
}

auto Plan::to_json() const -> nlohmann::json {
  nlohmann::json steps = nlohmann::json::array();
  for (const auto& step : steps_) {
    steps.push_back(step_to_json(step));
  }
  return {
      {"plan_id", plan_id_.str()},
      {"task_id", task_id_},
      {"steps", std::move(steps)},
      {"current_step_index", current_step_index_},
  };
}

auto Plan::from_json(const nlohmann::json& j) -> Result<Plan> {
  if (!j.is_object() || !j.contains("plan_id") || !j["plan_id"].is_string() ||
      !j.contains("task_id") || !j["task_id"].is_number_integer() ||
      !j.contains("steps") || !j["steps"].is_array()) {
    return fail(Error::ParseError);
  }

  std::vector<Step> steps;
  steps.reserve(j["steps"].size());
  for (const auto& sj : j["steps"]) {
    auto step = step_from_json(sj);
    if (!step) {
      return std::unexpected(step.error());
    }
    steps.push_back(std::move(*step));
  }

  Plan plan{PlanId{j["plan_id"].get<std::string>()},
            j["task_id"].get<TaskId>(), std::move(steps)};
  if (auto it = j.find("current_step_index");
      it != j.end() && it->is_number_unsigned()) {
    plan.current_step_index_ = it->get<std::size_t>();
  }
  return plan;
}

}  // namespace stepflow
