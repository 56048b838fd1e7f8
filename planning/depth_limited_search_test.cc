#include "planning/depth_limited_search.hh"

#include <unordered_map>

#include "gtest/gtest.h"

namespace npuzzle::planning {
namespace {
using NodeId = int;

SuccessorFunc<NodeId> successors_from_graph(
    const std::unordered_map<NodeId, std::vector<NodeId>> &graph) {
    return [graph](const NodeId &node) {
        std::vector<Successor<NodeId>> out;
        const auto iter = graph.find(node);
        if (iter == graph.end()) {
            return out;
        }
        for (const auto &next : iter->second) {
            out.push_back({.state = next, .edge_cost = 1.0});
        }
        return out;
    };
}

GoalCheckFunc<NodeId> is_node(const NodeId goal) {
    return [goal](const NodeId &node) { return node == goal; };
}
}  // namespace

TEST(DepthLimitedSearchTest, explores_first_successor_first) {
    // Setup
    //   0 ─► 1 ─► 3
    //   │         ▲
    //   └──► 2 ───┘
    const auto successors = successors_from_graph({{0, {1, 2}}, {1, {3}}, {2, {3}}});

    // Action
    const auto result = depth_limited_search<NodeId>(0, successors, is_node(3), 10);

    // Verification
    EXPECT_EQ(result.termination, Termination::FOUND);
    EXPECT_EQ(result.path, (std::vector<NodeId>{0, 1, 3}));
    EXPECT_EQ(result.num_nodes_expanded, 3);
    EXPECT_EQ(result.max_frontier_size, 2);
}

TEST(DepthLimitedSearchTest, does_not_expand_past_depth_limit) {
    // Setup
    // A chain 0 ─► 1 ─► 2 ─► 3 ─► 4
    const auto successors = successors_from_graph({{0, {1}}, {1, {2}}, {2, {3}}, {3, {4}}});

    // Action
    const auto limited = depth_limited_search<NodeId>(0, successors, is_node(4), 2);
    const auto unlimited = depth_limited_search<NodeId>(0, successors, is_node(4), 4);

    // Verification
    EXPECT_EQ(limited.termination, Termination::DEPTH_LIMIT_REACHED);
    EXPECT_TRUE(limited.path.empty());
    // 0, 1 and 2 are popped, 2 sits at the limit and is not expanded
    EXPECT_EQ(limited.num_nodes_expanded, 3);

    EXPECT_EQ(unlimited.termination, Termination::FOUND);
    EXPECT_EQ(unlimited.path, (std::vector<NodeId>{0, 1, 2, 3, 4}));
    EXPECT_EQ(unlimited.cost, 4.0);
}

TEST(DepthLimitedSearchTest, exhausts_without_reaching_limit) {
    // Setup
    const auto successors = successors_from_graph({{0, {1, 2}}, {1, {0}}, {2, {0}}});

    // Action
    const auto result = depth_limited_search<NodeId>(0, successors, is_node(5), 50);

    // Verification
    EXPECT_EQ(result.termination, Termination::EXHAUSTED);
    EXPECT_TRUE(result.path.empty());
    EXPECT_EQ(result.num_nodes_expanded, 3);
}

TEST(DepthLimitedSearchTest, initial_state_is_goal_with_zero_limit) {
    // Setup
    const auto successors = successors_from_graph({{0, {1}}});

    // Action
    const auto result = depth_limited_search<NodeId>(0, successors, is_node(0), 0);

    // Verification
    EXPECT_EQ(result.termination, Termination::FOUND);
    EXPECT_EQ(result.path, (std::vector<NodeId>{0}));
    EXPECT_EQ(result.num_nodes_expanded, 1);
}

TEST(DepthLimitedSearchTest, visited_states_are_not_requeued) {
    // Setup
    // 3 is first reached at depth 2 through 1 and is not queued again through 2.
    //   0 ─► 1 ─► 3 ─► 4
    //   └──► 2 ───┘
    const auto successors =
        successors_from_graph({{0, {1, 2}}, {1, {3}}, {2, {3}}, {3, {4}}});

    // Action
    const auto result = depth_limited_search<NodeId>(0, successors, is_node(4), 2);

    // Verification
    // 0, 1, 3 (at the limit) and 2 are popped.
    EXPECT_EQ(result.termination, Termination::DEPTH_LIMIT_REACHED);
    EXPECT_EQ(result.num_nodes_expanded, 4);
}
}  // namespace npuzzle::planning
