#pragma once

#include "stepflow/util/id.hpp"

#include <nlohmann/json.hpp>

#include <unordered_map>
#include <utility>
#include <vector>

namespace stepflow {

// Step outputs keyed by step id, remembering the order they were produced.
class StepResults {
public:
  auto set(const StepId& step_id, nlohmann::json result) -> void {
    auto [it, inserted] = values_.insert_or_assign(step_id, std::move(result));
    if (inserted) {
      order_.push_back(step_id);
    }
    latest_ = step_id;
  }

  [[nodiscard]] auto find(const StepId& step_id) const -> const nlohmann::json* {
    auto it = values_.find(step_id);
    return it != values_.end() ? &it->second : nullptr;
  }

  [[nodiscard]] auto contains(const StepId& step_id) const -> bool {
    return values_.contains(step_id);
  }

  // Most recently produced result, or nullptr when nothing has run yet.
  [[nodiscard]] auto latest() const -> const nlohmann::json* {
    return latest_.empty() ? nullptr : find(latest_);
  }

  [[nodiscard]] auto order() const noexcept -> const std::vector<StepId>& {
    return order_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return order_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return order_.empty(); }

  [[nodiscard]] auto to_json() const -> nlohmann::json {
    auto out = nlohmann::json::object();
    for (const auto& id : order_) {
      out[id.str()] = values_.at(id);
    }
    return out;
  }

private:
  std::unordered_map<StepId, nlohmann::json> values_;
  std::vector<StepId> order_;
  StepId latest_;
};

}  // namespace stepflow
