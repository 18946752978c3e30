#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/plan/step_results.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace stepflow {

// Evaluates branch conditions against step results. Grammar:
//
//   expr       := term (("and" | "or") term)*        left to right, no precedence
//   term       := "not" term | "(" expr ")" | comparison
//   comparison := "true" | "false" | value op value
//               | value "is_null" | value "is_not_null"
//   op         := == != > < >= <= contains
//   value      := accessor | "len" "(" accessor ")" | literal
//   accessor   := "result" ("." IDENT)+
//   literal    := NUMBER | STRING | true | false | null
//
// Keywords are case-insensitive. `result` binds to the source step's result
// when one is given, else to the most recently produced result. A missing
// field anywhere along an accessor yields null.
class ConditionEvaluator {
public:
  [[nodiscard]] static auto evaluate(
      std::string_view condition, const StepResults& results,
      const std::optional<StepId>& source_step_id = std::nullopt)
      -> DetailedResult<bool>;

  // Resolves a bare accessor expression such as `result.a.b`. A lone
  // `result` yields the whole bound result.
  [[nodiscard]] static auto resolve(
      std::string_view accessor, const StepResults& results,
      const std::optional<StepId>& source_step_id = std::nullopt)
      -> DetailedResult<nlohmann::json>;
};

}  // namespace stepflow
