#pragma once

#include <algorithm>
#include <functional>
#include <optional>
#include <vector>

#include "wise_enum.h"

namespace npuzzle::planning {

template <typename State>
struct Successor {
    State state;
    double edge_cost;
};

// Nodes live in a per-search arena. A node refers to its parent by index, so the path back to
// the initial state stays valid for the lifetime of the arena.
template <typename State>
struct Node {
    State state;
    std::optional<int> maybe_parent_idx;
    int depth;
    double cost_to_come;
    double est_cost_to_go;
};

template <typename State>
using SuccessorFunc = std::function<std::vector<Successor<State>>(const State &)>;

template <typename State>
using GoalCheckFunc = std::function<bool(const State &)>;

WISE_ENUM_CLASS(Termination, FOUND, EXHAUSTED, DEPTH_LIMIT_REACHED)

template <typename State>
struct SearchOutcome {
    Termination termination;
    // The states from the initial state to the goal, inclusive. Empty unless the goal was found.
    std::vector<State> path;
    double cost;
    int num_nodes_expanded;
    int max_frontier_size;
};

template <typename State>
std::vector<State> extract_path(const int end_idx, const std::vector<Node<State>> &nodes) {
    std::vector<State> out;
    for (std::optional<int> node_idx = end_idx; node_idx.has_value();
         node_idx = nodes.at(node_idx.value()).maybe_parent_idx) {
        out.push_back(nodes.at(node_idx.value()).state);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

}  // namespace npuzzle::planning
