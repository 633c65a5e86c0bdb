/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation: iterative DFS cycle check and BFS
 *        dependent sweep, both O(V+E).
 */

#include "scheduler/task_graph.hpp"

#include <algorithm>
#include <queue>
#include <stack>
#include <unordered_set>

namespace agent_dispatch {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

void TaskGraph::add_node(const TaskId& id) {
    dependents_[id];
    dependencies_[id];
}

void TaskGraph::add_edge(const TaskId& dependency, const TaskId& dependent) {
    if (has_edge(dependency, dependent)) return;
    dependents_[dependency].push_back(dependent);
    dependencies_[dependent].push_back(dependency);
    ++edges_;
}

// ─────────────────────────────────────────────
// Cycle Detection
// ─────────────────────────────────────────────

bool TaskGraph::would_create_cycle(const TaskId& task,
                                   const std::vector<TaskId>& dependencies) const {
    std::unordered_set<TaskId> visited;
    std::stack<TaskId> dfs_stack;

    for (const auto& dep : dependencies) {
        dfs_stack.push(dep);
    }

    while (!dfs_stack.empty()) {
        auto node = dfs_stack.top();
        dfs_stack.pop();

        if (node == task) {
            return true;
        }
        if (!visited.insert(node).second) continue;

        if (auto it = dependencies_.find(node); it != dependencies_.end()) {
            for (const auto& upstream : it->second) {
                if (!visited.contains(upstream)) {
                    dfs_stack.push(upstream);
                }
            }
        }
    }

    return false;
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::dependents(const TaskId& id) const {
    auto it = dependents_.find(id);
    if (it == dependents_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::dependencies(const TaskId& id) const {
    auto it = dependencies_.find(id);
    if (it == dependencies_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::transitive_dependents(const TaskId& id) const {
    std::vector<TaskId> reached;
    std::unordered_set<TaskId> seen{id};
    std::queue<TaskId> frontier;
    frontier.push(id);

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();

        auto it = dependents_.find(current);
        if (it == dependents_.end()) continue;
        for (const auto& next : it->second) {
            if (seen.insert(next).second) {
                reached.push_back(next);
                frontier.push(next);
            }
        }
    }

    return reached;
}

bool TaskGraph::contains(const TaskId& id) const {
    return dependencies_.contains(id);
}

bool TaskGraph::has_edge(const TaskId& dependency, const TaskId& dependent) const {
    auto it = dependents_.find(dependency);
    if (it == dependents_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), dependent) != it->second.end();
}

size_t TaskGraph::node_count() const noexcept {
    return dependencies_.size();
}

size_t TaskGraph::edge_count() const noexcept {
    return edges_;
}

}  // namespace agent_dispatch
