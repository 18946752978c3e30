#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/plan/plan.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stepflow {

// Input handed to a planning strategy.
struct PlanRequest {
  TaskId task_id{0};
  std::string_view kind;
  std::string_view input_text;
  const nlohmann::json& input_data;
};

// Builds the ordered step list for one task kind. Strategies are pure: the
// same request always yields the same shape of plan.
using PlanStrategy = std::function<std::vector<Step>(const PlanRequest&)>;

class PlanManager {
public:
  static constexpr std::string_view kDefaultKind = "general";

  // Registers the built-in strategies.
  PlanManager();

  // Replaces any strategy already registered for the kind.
  auto register_strategy(std::string kind, PlanStrategy strategy) -> void;
  [[nodiscard]] auto has_strategy(std::string_view kind) const -> bool;
  // Registered kinds in lexical order.
  [[nodiscard]] auto kinds() const -> std::vector<std::string>;

  // Unknown kinds fall back to the default strategy.
  [[nodiscard]] auto build(TaskId task_id, std::string_view kind,
                           std::string_view input_text,
                           const nlohmann::json& input_data) const -> Plan;

private:
  std::unordered_map<std::string, PlanStrategy, StringHash, StringEqual>
      strategies_;
};

}  // namespace stepflow
