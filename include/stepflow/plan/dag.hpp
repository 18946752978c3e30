#pragma once

#include "stepflow/core/error.hpp"
#include "stepflow/util/id.hpp"

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace stepflow {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Dependency graph over the steps of one plan. An edge from -> to means
// `to` depends on `from`.
class DAG {
public:
  auto add_node(const StepId& step_id) -> NodeIndex;
  [[nodiscard]] auto add_edge(const StepId& from, const StepId& to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const StepId& step_id) const -> bool;
  [[nodiscard]] auto is_valid() const -> Result<void>;

  [[nodiscard]] auto get_topological_order() const -> std::vector<StepId>;
  [[nodiscard]] auto get_deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto get_dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto get_index(const StepId& step_id) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> StepId;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return nodes_.empty();
  }

private:
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<StepId> keys_;
  std::unordered_map<StepId, NodeIndex> key_to_idx_;
};

}  // namespace stepflow
