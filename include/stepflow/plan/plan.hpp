#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/plan/step.hpp"
#include "stepflow/util/id.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace stepflow {

class Plan {
public:
  Plan() = default;
  Plan(PlanId plan_id, TaskId task_id, std::vector<Step> steps);

  [[nodiscard]] auto id() const noexcept -> const PlanId& { return plan_id_; }
  [[nodiscard]] auto task_id() const noexcept -> TaskId { return task_id_; }

  [[nodiscard]] auto steps() const noexcept -> const std::vector<Step>& {
    return steps_;
  }
  [[nodiscard]] auto steps() noexcept -> std::vector<Step>& { return steps_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return steps_.size(); }

  [[nodiscard]] auto find_step(const StepId& step_id) -> Step*;
  [[nodiscard]] auto find_step(const StepId& step_id) const -> const Step*;
  [[nodiscard]] auto index_of(const StepId& step_id) const -> std::optional<std::size_t>;

  // First pending step, in declaration order, whose dependencies are all
  // completed or skipped. Records its index as the current step.
  [[nodiscard]] auto get_next_step() -> Step*;

  // True when every step is completed or skipped (vacuously for no steps).
  [[nodiscard]] auto is_complete() const -> bool;
  [[nodiscard]] auto has_failed() const -> bool;

  [[nodiscard]] auto current_step_index() const noexcept -> std::size_t {
    return current_step_index_;
  }

  // Unique step ids, every dependency declared in the plan, no cycles.
  [[nodiscard]] auto validate() const -> Result<void>;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
  [[nodiscard]] static auto from_json(const nlohmann::json& j) -> Result<Plan>;

private:
  PlanId plan_id_;
  TaskId task_id_{0};
  std::vector<Step> steps_;
  std::size_t current_step_index_{0};
};

[[nodiscard]] auto step_to_json(const Step& step) -> nlohmann::json;
[[nodiscard]] auto step_from_json(const nlohmann::json& j) -> Result<Step>;

}  // namespace stepflow
