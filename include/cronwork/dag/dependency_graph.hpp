#pragma once

#include "cronwork/core/error.hpp"
#include "cronwork/util/id.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cronwork {

// "successor must not start until predecessor completes"
struct DependencyEdge {
  TaskId predecessor{kInvalidTaskId};
  TaskId successor{kInvalidTaskId};

  friend auto operator<=>(const DependencyEdge&,
                          const DependencyEdge&) = default;
};

using CompletedSet = std::unordered_set<TaskId>;

class DependencyGraph {
public:
  using NodeIndex = std::uint32_t;
  static constexpr NodeIndex kInvalidNode = UINT32_MAX;

  auto add_node(TaskId task_id) -> NodeIndex;

  // All-or-nothing: on error the graph is left exactly as it was.
  // Every edge endpoint must be in `task_ids` or already in the graph.
  [[nodiscard]] auto add_edges(std::span<const TaskId> task_ids,
                               std::span<const DependencyEdge> edges)
      -> Result<void>;

  // True when every predecessor of `task_id` is in `completed`.
  // Tasks unknown to the graph have no predecessors.
  [[nodiscard]] auto ready(TaskId task_id, const CompletedSet& completed) const
      -> bool;

  [[nodiscard]] auto has_node(TaskId task_id) const -> bool;
  [[nodiscard]] auto has_edge(TaskId from, TaskId to) const -> bool;
  [[nodiscard]] auto predecessors(TaskId task_id) const -> std::vector<TaskId>;
  [[nodiscard]] auto successors(TaskId task_id) const -> std::vector<TaskId>;

  // Kahn order; shorter than size() only if the graph holds a cycle.
  [[nodiscard]] auto topological_order() const -> std::vector<TaskId>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return nodes_.empty();
  }
  [[nodiscard]] auto edge_count() const noexcept -> std::size_t {
    return edge_count_;
  }
  auto clear() -> void;

private:
  [[nodiscard]] auto index_of(TaskId task_id) const -> NodeIndex;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  std::unordered_map<TaskId, NodeIndex> key_to_idx_;
  std::size_t edge_count_{0};
};

// One independent graph per job name; a cycle in one job never blocks
// another.
class DependencyGraphSet {
public:
  [[nodiscard]] auto add_edges(std::string_view job_name,
                               std::span<const TaskId> task_ids,
                               std::span<const DependencyEdge> edges)
      -> Result<void>;

  // A task may appear in several jobs; it is ready only if ready in all.
  [[nodiscard]] auto ready(TaskId task_id, const CompletedSet& completed) const
      -> bool;

  [[nodiscard]] auto find(std::string_view job_name) const
      -> const DependencyGraph*;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return graphs_.size();
  }

private:
  std::map<std::string, DependencyGraph, std::less<>> graphs_;
};

}  // namespace cronwork
