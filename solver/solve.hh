#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "domain/sliding_puzzle.hh"
#include "domain/solvability.hh"
#include "planning/search_node.hh"
#include "solver/algorithm.hh"
#include "solver/solver_config.hh"
#include "wise_enum.h"

namespace npuzzle::solver {

struct SearchResult {
    bool success;
    Algorithm algorithm;
    planning::Termination termination;
    // Boards from the start to the goal, inclusive. Empty if no solution was found.
    std::vector<domain::Board> solution_path;
    int solution_depth;
    int nodes_expanded;
    // Largest size reached by the queue, stack or priority queue during the search.
    int max_frontier_size;
    std::chrono::duration<double> elapsed;
    // Describes why the search failed. Empty on success.
    std::string message;
};

// Searches for a path from `start` to the goal of the same size. The caller is expected to
// have checked that the board is solvable; otherwise the search runs until the reachable states
// are exhausted.
SearchResult solve(const domain::Board &start, const Algorithm algorithm,
                   const SolverConfig &config = {});

WISE_ENUM_CLASS(SolveStatus, SOLVED, EXHAUSTED, UNSOLVABLE, MALFORMED_BOARD, UNSUPPORTED_SIZE,
                UNKNOWN_ALGORITHM)

struct SolveRequest {
    std::vector<std::vector<int>> board;
    // The default algorithm from the config is used if this is not set.
    std::optional<std::string> algorithm;
};

struct SolveResponse {
    SolveStatus status;
    // The algorithm as named by the request.
    std::string algorithm;
    // Dimension of the requested board, if it could be determined.
    std::optional<int> size;
    std::optional<domain::Solvability> solvability;
    // Set when a search was run.
    std::optional<SearchResult> result;
    std::string message;
};

// Validates the request, checks solvability and runs the requested search. Problems with the
// request are reported through the response status; nothing is thrown for bad input.
SolveResponse solve_request(const SolveRequest &request, const SolverConfig &config = {});

}  // namespace npuzzle::solver
