#pragma once

#include <algorithm>
#include <optional>
#include <queue>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "planning/search_node.hh"

namespace npuzzle::planning {

// Find a path through a graph.
// SuccessorFunc returns a list of successors and must have the interface:
//     Iterable<Successor<State>>(const State &)
// HeuristicFunc returns the estimated cost from the argument node to a goal node. It should have
//     the interface: double(const State &)
// GoalCheck returns true if the node is a goal state.
//
// Nodes with equal estimated total cost are expanded in the order they were queued. If the
// heuristic is consistent, the first goal to be expanded is reached by a cheapest path.
template <typename State, typename SuccessorFunc, typename HeuristicFunc, typename GoalCheck>
SearchOutcome<State> a_star(const State &initial_state, const SuccessorFunc &successors_for_state,
                            const HeuristicFunc &heuristic, const GoalCheck &termination_check) {
    struct Compare {
        const std::vector<Node<State>> *nodes;
        bool operator()(const int a, const int b) const {
            // This operator should return true if a should be expanded after b;
            const auto &head_a = nodes->at(a);
            const auto &head_b = nodes->at(b);
            const double cost_a = head_a.cost_to_come + head_a.est_cost_to_go;
            const double cost_b = head_b.cost_to_come + head_b.est_cost_to_go;

            if (cost_a == cost_b) {
                // Node indices increase with insertion order
                return a > b;
            }
            return cost_a > cost_b;
        }
    };

    std::vector<Node<State>> nodes;
    nodes.push_back(Node<State>{
        .state = initial_state,
        .maybe_parent_idx = std::nullopt,
        .depth = 0,
        .cost_to_come = 0.0,
        .est_cost_to_go = heuristic(initial_state),
    });

    std::priority_queue<int, std::vector<int>, Compare> queue(Compare{.nodes = &nodes});
    queue.push(0);
    // Lowest cost to come found so far for each state that has been queued
    absl::flat_hash_map<State, double> best_cost_from_state = {{initial_state, 0.0}};

    int nodes_expanded = 0;
    int max_frontier_size = queue.size();
    while (!queue.empty()) {
        const int node_idx = queue.top();
        queue.pop();
        // nodes.push_back() can re-alloc, so work from a copy
        const Node<State> curr_node = nodes.at(node_idx);

        if (curr_node.cost_to_come > best_cost_from_state.at(curr_node.state)) {
            // A cheaper path to this state was queued after this node was
            continue;
        }

        nodes_expanded++;

        // Goal Check
        if (termination_check(curr_node.state)) {
            return SearchOutcome<State>{
                .termination = Termination::FOUND,
                .path = extract_path(node_idx, nodes),
                .cost = curr_node.cost_to_come,
                .num_nodes_expanded = nodes_expanded,
                .max_frontier_size = max_frontier_size,
            };
        }

        for (const Successor<State> &successor : successors_for_state(curr_node.state)) {
            const double cost_to_come = curr_node.cost_to_come + successor.edge_cost;
            const auto best_cost_iter = best_cost_from_state.find(successor.state);
            if (best_cost_iter != best_cost_from_state.end() &&
                best_cost_iter->second <= cost_to_come) {
                continue;
            }
            best_cost_from_state.insert_or_assign(successor.state, cost_to_come);

            nodes.push_back(Node<State>{
                .state = successor.state,
                .maybe_parent_idx = node_idx,
                .depth = curr_node.depth + 1,
                .cost_to_come = cost_to_come,
                .est_cost_to_go = heuristic(successor.state),
            });
            queue.push(nodes.size() - 1);
        }
        max_frontier_size = std::max(max_frontier_size, static_cast<int>(queue.size()));
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
