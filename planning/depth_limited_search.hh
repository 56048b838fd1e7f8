#pragma once

#include <algorithm>
#include <optional>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "planning/search_node.hh"

namespace npuzzle::planning {

// Depth first search that does not expand nodes at `depth_limit`. A single visited set is shared
// by all branches, so a state reached first along a long branch is not revisited along a
// shorter one. The returned path is therefore not necessarily the shallowest.
//
// Successors are pushed in reverse so that the first successor returned by
// `successors_for_state` is the first to be explored.
template <typename State>
SearchOutcome<State> depth_limited_search(const State &initial_state,
                                          const SuccessorFunc<State> &successors_for_state,
                                          const GoalCheckFunc<State> &goal_check,
                                          const int depth_limit) {
    std::vector<Node<State>> nodes = {{.state = initial_state,
                                       .maybe_parent_idx = std::nullopt,
                                       .depth = 0,
                                       .cost_to_come = 0.0,
                                       .est_cost_to_go = 0.0}};
    std::vector<int> node_idx_stack = {0};
    absl::flat_hash_set<State> visited = {initial_state};

    int nodes_expanded = 0;
    int max_frontier_size = node_idx_stack.size();
    bool hit_depth_limit = false;
    while (!node_idx_stack.empty()) {
        const int node_idx = node_idx_stack.back();
        node_idx_stack.pop_back();
        nodes_expanded++;
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

        if (n.depth >= depth_limit) {
            hit_depth_limit = true;
            continue;
        }

        const auto successors = successors_for_state(n.state);
        for (auto iter = successors.rbegin(); iter != successors.rend(); ++iter) {
            if (!visited.insert(iter->state).second) {
                continue;
            }
            nodes.push_back(Node<State>{.state = iter->state,
                                        .maybe_parent_idx = node_idx,
                                        .depth = n.depth + 1,
                                        .cost_to_come = n.cost_to_come + iter->edge_cost,
                                        .est_cost_to_go = 0.0});
            node_idx_stack.push_back(nodes.size() - 1);
        }
        max_frontier_size = std::max(max_frontier_size, static_cast<int>(node_idx_stack.size()));
    }

    return SearchOutcome<State>{
        .termination =
            hit_depth_limit ? Termination::DEPTH_LIMIT_REACHED : Termination::EXHAUSTED,
        .path = {},
        .cost = 0.0,
        .num_nodes_expanded = nodes_expanded,
        .max_frontier_size = max_frontier_size,
    };
}
}  // namespace npuzzle::planning
