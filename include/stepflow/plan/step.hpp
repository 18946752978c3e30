#pragma once

#include "stepflow/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stepflow {

enum class ActionKind : std::uint8_t {
  LlmCall,
  ToolCall,
  Approval,
  Condition,
  Aggregate,
};

enum class StepStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Skipped,
};

// A completed or skipped dependency counts as satisfied.
[[nodiscard]] constexpr auto is_settled(StepStatus status) noexcept -> bool {
  return status == StepStatus::Completed || status == StepStatus::Skipped;
}

struct Step {
  using time_point = std::chrono::system_clock::time_point;

  StepId step_id;
  ActionKind action{ActionKind::LlmCall};
  nlohmann::json params = nlohmann::json::object();
  std::vector<StepId> depends_on;

  StepStatus status{StepStatus::Pending};
  nlohmann::json result;  // null until completed
  std::optional<std::string> error;
  std::optional<std::string> snapshot_ref;

  std::optional<time_point> started_at;
  std::optional<time_point> completed_at;
};

}  // namespace stepflow
