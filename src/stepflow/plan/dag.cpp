#include "stepflow/plan/dag.hpp"

#include <queue>
#include <ranges>

namespace stepflow {

auto DAG::add_node(const StepId& step_id) -> NodeIndex {
  auto it = key_to_idx_.find(step_id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  NodeIndex idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(step_id);
  key_to_idx_.emplace(step_id, idx);
  return idx;
}

auto DAG::add_edge(const StepId& from, const StepId& to) -> Result<void> {
  NodeIndex from_idx = get_index(from);
  NodeIndex to_idx = get_index(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto DAG::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (from == to || would_create_cycle(from, to)) {
    return fail(Error::CycleDetected);
  }

  nodes_[to].deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

// Adding from -> to closes a cycle iff `from` already (transitively) depends
// on `to`.
auto DAG::would_create_cycle(NodeIndex from, NodeIndex to) const -> bool {
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<NodeIndex> stack{from};

  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();

    if (current == to) {
      return true;
    }

    if (visited[current]) {
      continue;
    }
    visited[current] = true;

    for (NodeIndex dep : nodes_[current].deps) {
      if (!visited[dep]) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

auto DAG::has_node(const StepId& step_id) const -> bool {
  return key_to_idx_.contains(step_id);
}

auto DAG::is_valid() const -> Result<void> {
  std::vector<std::uint8_t> state(nodes_.size(), 0);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;

  for (NodeIndex start : std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(nodes_.size()))) {
    if (state[start] != 0)
      continue;

    stack.push_back({start, 0});
    state[start] = 1;

    while (!stack.empty()) {
      auto& [node, child_idx] = stack.back();
      const auto& dependents = nodes_[node].dependents;

      if (child_idx < dependents.size()) {
        NodeIndex child = dependents[child_idx++];
        if (state[child] == 1) {
          return fail(Error::CycleDetected);
        }
        if (state[child] == 0) {
          state[child] = 1;
          stack.push_back({child, 0});
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto DAG::get_topological_order() const -> std::vector<StepId> {
  auto in_degree = nodes_ | std::views::transform([](const Node& n) {
                     return static_cast<int>(n.deps.size());
                   }) |
                   std::ranges::to<std::vector>();

  std::queue<NodeIndex> ready;
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      ready.push(static_cast<NodeIndex>(i));
    }
  }

  std::vector<StepId> result;
  result.reserve(nodes_.size());
  while (!ready.empty()) {
    NodeIndex current = ready.front();
    ready.pop();
    result.push_back(keys_[current]);

    for (NodeIndex dep : nodes_[current].dependents) {
      if (--in_degree[dep] == 0) {
        ready.push(dep);
      }
    }
  }

  return result;
}

auto DAG::get_deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DAG::get_dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DAG::get_index(const StepId& step_id) const -> NodeIndex {
  auto it = key_to_idx_.find(step_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DAG::get_key(NodeIndex idx) const -> StepId {
  if (idx >= keys_.size()) {
    return {};
  }
  return keys_[idx];
}

}  // namespace stepflow
