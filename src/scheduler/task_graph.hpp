/**
 * @file task_graph.hpp
 * @brief Dependency graph between tasks.
 *
 * Edges run from a dependency to its dependent. The graph is kept acyclic
 * by checking every proposed edge set with would_create_cycle() before it
 * is added. Not thread-safe: the TaskManager guards it with its own lock.
 */

#pragma once

#include "core/types.hpp"

#include <unordered_map>
#include <vector>

namespace agent_dispatch {

class TaskGraph {
public:
    TaskGraph() = default;

    // ── Construction ──────────────────────────
    void add_node(const TaskId& id);
    void add_edge(const TaskId& dependency, const TaskId& dependent);

    // ── Queries ───────────────────────────────

    /**
     * @brief Would making `task` depend on `dependencies` close a cycle?
     *
     * Walks the dependency sets of the proposed dependencies depth-first;
     * reaching `task` means a cycle. A dependency equal to `task` itself is
     * a cycle too.
     */
    [[nodiscard]] bool would_create_cycle(const TaskId& task,
                                          const std::vector<TaskId>& dependencies) const;

    [[nodiscard]] std::vector<TaskId> dependents(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> dependencies(const TaskId& id) const;

    /// Every task reachable through dependents edges, breadth-first, without `id`.
    [[nodiscard]] std::vector<TaskId> transitive_dependents(const TaskId& id) const;

    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] bool has_edge(const TaskId& dependency, const TaskId& dependent) const;
    [[nodiscard]] size_t node_count() const noexcept;
    [[nodiscard]] size_t edge_count() const noexcept;

private:
    std::unordered_map<TaskId, std::vector<TaskId>> dependents_;     // forward edges
    std::unordered_map<TaskId, std::vector<TaskId>> dependencies_;   // backward edges
    size_t edges_{0};
};

}  // namespace agent_dispatch
