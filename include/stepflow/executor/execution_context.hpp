#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/plan/plan.hpp"
#include "stepflow/plan/step_results.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <format>
#include <string>

namespace stepflow {

struct ExecutionLimits {
  int max_steps{20};
  std::chrono::seconds max_wall_time{300};
};

// Per-run state of the agent loop. Lives for one claim of one task.
struct ExecutionContext {
  TaskId task_id{0};
  OwnerId owner_id{0};
  std::string input_text;
  nlohmann::json input_data = nlohmann::json::object();

  Plan plan;
  StepResults step_results;
  int steps_executed{0};

  ExecutionLimits limits;
  std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

  [[nodiscard]] auto elapsed() const -> std::chrono::duration<double> {
    return std::chrono::steady_clock::now() - start_time;
  }

  [[nodiscard]] auto check_limits() const -> DetailedResult<void> {
    if (steps_executed >= limits.max_steps) {
      return fail(Error::LimitExceeded,
                  std::format("Step limit exceeded: {}/{}", steps_executed,
                              limits.max_steps));
    }
    auto elapsed_sec = elapsed().count();
    if (elapsed_sec >= static_cast<double>(limits.max_wall_time.count())) {
      return fail(Error::LimitExceeded,
                  std::format("Time limit exceeded: {:.1f}s/{}s", elapsed_sec,
                              limits.max_wall_time.count()));
    }
    return {};
  }
};

}  // namespace stepflow
