#pragma once

#include <algorithm>
#include <deque>
#include <optional>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "planning/search_node.hh"

namespace npuzzle::planning {

// Breadth first search with a visited set. States are marked as visited when they are queued,
// so each state enters the queue at most once. With uniform edge costs the first goal that is
// dequeued is at minimal depth.
template <typename State>
SearchOutcome<State> breadth_first_search(const State &initial_state,
                                          const SuccessorFunc<State> &successors_for_state,
                                          const GoalCheckFunc<State> &goal_check) {
    std::vector<Node<State>> nodes = {{.state = initial_state,
                                       .maybe_parent_idx = std::nullopt,
                                       .depth = 0,
                                       .cost_to_come = 0.0,
                                       .est_cost_to_go = 0.0}};
    std::deque<int> node_idx_queue = {0};
    absl::flat_hash_set<State> visited = {initial_state};

    int nodes_expanded = 0;
    int max_frontier_size = node_idx_queue.size();
    while (!node_idx_queue.empty()) {
        const int node_idx = node_idx_queue.front();
        node_idx_queue.pop_front();
        nodes_expanded++;
        // Make a copy to avoid invalidated references when pushing back on nodes
        const Node<State> n = nodes.at(node_idx);

        if (goal_check(n.state)) {
            return SearchOutcome<State>{
                .termination = Termination::FOUND,
                .path = extract_path(node_idx, nodes),
                .cost = n.cost_to_come,
                .num_nodes_expanded = nodes_expanded,
                .max_frontier_size = max_frontier_size,
            };
        }

        for (const auto &successor : successors_for_state(n.state)) {
            if (!visited.insert(successor.state).second) {
                continue;
            }
            nodes.push_back(Node<State>{.state = successor.state,
                                        .maybe_parent_idx = node_idx,
                                        .depth = n.depth + 1,
                                        .cost_to_come = n.cost_to_come + successor.edge_cost,
                                        .est_cost_to_go = 0.0});
            node_idx_queue.push_back(nodes.size() - 1);
        }
        max_frontier_size = std::max(max_frontier_size, static_cast<int>(node_idx_queue.size()));
    }

    return SearchOutcome<State>{
        .termination = Termination::EXHAUSTED,
        .path = {},
        .cost = 0.0,
        .num_nodes_expanded = nodes_expanded,
        .max_frontier_size = max_frontier_size,
    };
}
}  // namespace npuzzle::planning
