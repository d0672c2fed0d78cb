#include "cronwork/dag/dependency_graph.hpp"

#include <algorithm>
#include <queue>
#include <ranges>

namespace cronwork {

auto DependencyGraph::add_node(TaskId task_id) -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  if (it != key_to_idx_.end()) {
    return it->second;
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(task_id);
  key_to_idx_.emplace(task_id, idx);
  return idx;
}

auto DependencyGraph::add_edges(std::span<const TaskId> task_ids,
                                std::span<const DependencyEdge> edges)
    -> Result<void> {
  DependencyGraph staged = *this;
  for (TaskId id : task_ids) {
    staged.add_node(id);
  }

  for (const auto& edge : edges) {
    NodeIndex from = staged.index_of(edge.predecessor);
    NodeIndex to = staged.index_of(edge.successor);
    if (from == kInvalidNode || to == kInvalidNode) [[unlikely]] {
      return fail(Error::NotFound);
    }
    if (auto r = staged.add_edge(from, to); !r) {
      return r;
    }
  }

  if (staged.topological_order().size() != staged.size()) {
    return fail(Error::CycleDetected);
  }

  *this = std::move(staged);
  return ok();
}

auto DependencyGraph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from == to) {
    return fail(Error::CycleDetected);
  }
  if (std::ranges::contains(nodes_[to].deps, from)) {
    return ok();
  }
  if (would_create_cycle(from, to)) {
    return fail(Error::CycleDetected);
  }

  nodes_[to].deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  ++edge_count_;
  return ok();
}

// Adding from->to closes a cycle iff `to` is already an ancestor of `from`.
auto DependencyGraph::would_create_cycle(NodeIndex from, NodeIndex to) const
    -> bool {
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<NodeIndex> stack;
  stack.push_back(from);

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

auto DependencyGraph::ready(TaskId task_id, const CompletedSet& completed) const
    -> bool {
  NodeIndex idx = index_of(task_id);
  if (idx == kInvalidNode) {
    return true;
  }
  return std::ranges::all_of(nodes_[idx].deps, [&](NodeIndex dep) {
    return completed.contains(keys_[dep]);
  });
}

auto DependencyGraph::has_node(TaskId task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto DependencyGraph::has_edge(TaskId from, TaskId to) const -> bool {
  NodeIndex f = index_of(from);
  NodeIndex t = index_of(to);
  if (f == kInvalidNode || t == kInvalidNode) {
    return false;
  }
  return std::ranges::contains(nodes_[t].deps, f);
}

auto DependencyGraph::predecessors(TaskId task_id) const
    -> std::vector<TaskId> {
  NodeIndex idx = index_of(task_id);
  if (idx == kInvalidNode) {
    return {};
  }
  return nodes_[idx].deps |
         std::views::transform([this](NodeIndex i) { return keys_[i]; }) |
         std::ranges::to<std::vector>();
}

auto DependencyGraph::successors(TaskId task_id) const -> std::vector<TaskId> {
  NodeIndex idx = index_of(task_id);
  if (idx == kInvalidNode) {
    return {};
  }
  return nodes_[idx].dependents |
         std::views::transform([this](NodeIndex i) { return keys_[i]; }) |
         std::ranges::to<std::vector>();
}

auto DependencyGraph::topological_order() const -> std::vector<TaskId> {
  auto in_degree = nodes_ | std::views::transform([](const Node& n) {
                     return n.deps.size();
                   }) |
                   std::ranges::to<std::vector>();

  std::queue<NodeIndex> ready;
  for (NodeIndex i = 0; i < in_degree.size(); ++i) {
    if (in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<TaskId> result;
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

auto DependencyGraph::index_of(TaskId task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::clear() -> void {
  nodes_.clear();
  keys_.clear();
  key_to_idx_.clear();
  edge_count_ = 0;
}

auto DependencyGraphSet::add_edges(std::string_view job_name,
                                   std::span<const TaskId> task_ids,
                                   std::span<const DependencyEdge> edges)
    -> Result<void> {
  auto it = graphs_.find(job_name);
  if (it != graphs_.end()) {
    return it->second.add_edges(task_ids, edges);
  }

  DependencyGraph graph;
  if (auto r = graph.add_edges(task_ids, edges); !r) {
    return r;
  }
  graphs_.emplace(std::string(job_name), std::move(graph));
  return ok();
}

auto DependencyGraphSet::ready(TaskId task_id,
                               const CompletedSet& completed) const -> bool {
  return std::ranges::all_of(graphs_, [&](const auto& entry) {
    return entry.second.ready(task_id, completed);
  });
}

auto DependencyGraphSet::find(std::string_view job_name) const
    -> const DependencyGraph* {
  auto it = graphs_.find(job_name);
  return it != graphs_.end() ? &it->second : nullptr;
}

}  // namespace cronwork
