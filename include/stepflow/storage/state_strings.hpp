#pragma once

#include "stepflow/kernel/task.hpp"
#include "stepflow/plan/step.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace stepflow {

namespace detail {

constexpr std::array<std::string_view, 6> kTaskStatusNames = {
    "queued", "running", "paused", "succeeded", "failed", "cancelled",
};

constexpr std::array<std::string_view, 3> kPauseReasonNames = {
    "approval",
    "dependency",
    "rate_limit",
};

constexpr std::array<std::string_view, 5> kStepStatusNames = {
    "pending", "running", "completed", "failed", "skipped",
};

constexpr std::array<std::string_view, 5> kActionKindNames = {
    "llm_call", "tool_call", "approval", "condition", "aggregate",
};

template <typename E, std::size_t N>
[[nodiscard]] constexpr auto find_name(const std::array<std::string_view, N>& names,
                                       std::string_view name) noexcept
    -> std::optional<E> {
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return std::nullopt;
  }
  return static_cast<E>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size()
             ? detail::kTaskStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  return detail::find_name<TaskStatus>(detail::kTaskStatusNames, name);
}

[[nodiscard]] inline auto pause_reason_name(PauseReason reason) noexcept
    -> const char* {
  auto idx = std::to_underlying(reason);
  return idx < detail::kPauseReasonNames.size()
             ? detail::kPauseReasonNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_pause_reason(std::string_view name) noexcept
    -> std::optional<PauseReason> {
  return detail::find_name<PauseReason>(detail::kPauseReasonNames, name);
}

[[nodiscard]] inline auto step_status_name(StepStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kStepStatusNames.size()
             ? detail::kStepStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_step_status(std::string_view name) noexcept
    -> std::optional<StepStatus> {
  return detail::find_name<StepStatus>(detail::kStepStatusNames, name);
}

[[nodiscard]] inline auto action_kind_name(ActionKind kind) noexcept
    -> const char* {
  auto idx = std::to_underlying(kind);
  return idx < detail::kActionKindNames.size()
             ? detail::kActionKindNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_action_kind(std::string_view name) noexcept
    -> std::optional<ActionKind> {
  return detail::find_name<ActionKind>(detail::kActionKindNames, name);
}

}  // namespace stepflow
