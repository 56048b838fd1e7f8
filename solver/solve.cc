#include "solver/solve.hh"

#include <variant>

#include "fmt/format.h"
#include "planning/a_star.hh"
#include "planning/breadth_first_search.hh"
#include "planning/depth_limited_search.hh"

namespace npuzzle::solver {
namespace {
using domain::Board;
using planning::SearchOutcome;
using planning::Termination;

std::vector<planning::Successor<Board>> successors_for_board(const Board &board) {
    std::vector<planning::Successor<Board>> out;
    for (auto &neighbor : domain::neighbors(board)) {
        out.push_back({.state = std::move(neighbor.board), .edge_cost = 1.0});
    }
    return out;
}

SearchOutcome<Board> run_search(const Board &start, const Board &goal, const Algorithm algorithm,
                                const SolverConfig &config) {
    const planning::GoalCheckFunc<Board> goal_check = [&goal](const Board &board) {
        return board == goal;
    };

    switch (algorithm) {
        case Algorithm::BFS:
            return planning::breadth_first_search<Board>(start, successors_for_board, goal_check);
        case Algorithm::DFS:
            return planning::depth_limited_search<Board>(start, successors_for_board, goal_check,
                                                         config.depth_limit);
        case Algorithm::A_STAR:
            break;
    }

    const auto heuristic = [&goal](const Board &board) -> double {
        return domain::manhattan_distance(board, goal);
    };
    return planning::a_star(start, successors_for_board, heuristic, goal_check);
}

std::string failure_message(const SearchOutcome<Board> &outcome, const SolverConfig &config) {
    switch (outcome.termination) {
        case Termination::FOUND:
            return "";
        case Termination::DEPTH_LIMIT_REACHED:
            return fmt::format("No solution found within depth limit of {}", config.depth_limit);
        case Termination::EXHAUSTED:
            break;
    }
    return fmt::format("No solution found after expanding {} nodes", outcome.num_nodes_expanded);
}

SolveStatus status_from_error(const domain::BoardError &error) {
    switch (error.type) {
        case domain::BoardErrorType::UNSUPPORTED_SIZE:
            return SolveStatus::UNSUPPORTED_SIZE;
        case domain::BoardErrorType::MALFORMED_BOARD:
            break;
    }
    return SolveStatus::MALFORMED_BOARD;
}
}  // namespace

SearchResult solve(const Board &start, const Algorithm algorithm, const SolverConfig &config) {
    const Board goal = Board::goal(start.size());

    const auto start_time = std::chrono::steady_clock::now();
    const SearchOutcome<Board> outcome = run_search(start, goal, algorithm, config);
    const auto end_time = std::chrono::steady_clock::now();

    const bool success = outcome.termination == Termination::FOUND;
    return SearchResult{
        .success = success,
        .algorithm = algorithm,
        .termination = outcome.termination,
        .solution_path = outcome.path,
        .solution_depth = success ? static_cast<int>(outcome.path.size()) - 1 : 0,
        .nodes_expanded = outcome.num_nodes_expanded,
        .max_frontier_size = outcome.max_frontier_size,
        .elapsed = end_time - start_time,
        .message = failure_message(outcome, config),
    };
}

SolveResponse solve_request(const SolveRequest &request, const SolverConfig &config) {
    const std::string algorithm_name =
        request.algorithm.value_or(to_string(config.default_algorithm));
    const auto maybe_algorithm = algorithm_from_string(algorithm_name);
    if (!maybe_algorithm.has_value()) {
        return SolveResponse{
            .status = SolveStatus::UNKNOWN_ALGORITHM,
            .algorithm = algorithm_name,
            .size = std::nullopt,
            .solvability = std::nullopt,
            .result = std::nullopt,
            .message = fmt::format("Unknown algorithm: {}", algorithm_name),
        };
    }

    const auto maybe_board = domain::parse_board(request.board);
    if (std::holds_alternative<domain::BoardError>(maybe_board)) {
        const auto &error = std::get<domain::BoardError>(maybe_board);
        return SolveResponse{
            .status = status_from_error(error),
            .algorithm = algorithm_name,
            .size = error.size,
            .solvability = std::nullopt,
            .result = std::nullopt,
            .message = error.message,
        };
    }
    const auto &board = std::get<Board>(maybe_board);

    std::optional<domain::Solvability> maybe_solvability;
    if (config.check_solvability) {
        maybe_solvability = domain::check_solvability(board);
        if (!maybe_solvability->is_solvable) {
            return SolveResponse{
                .status = SolveStatus::UNSOLVABLE,
                .algorithm = algorithm_name,
                .size = board.size(),
                .solvability = maybe_solvability,
                .result = std::nullopt,
                .message = fmt::format(
                    "This puzzle has {} inversion(s) and is not solvable. Try a different "
                    "configuration.",
                    maybe_solvability->inversions),
            };
        }
    }

    SearchResult result = solve(board, maybe_algorithm.value(), config);
    const SolveStatus status = result.success ? SolveStatus::SOLVED : SolveStatus::EXHAUSTED;
    std::string message = result.message;
    return SolveResponse{
        .status = status,
        .algorithm = algorithm_name,
        .size = board.size(),
        .solvability = maybe_solvability,
        .result = std::move(result),
        .message = std::move(message),
    };
}

}  // namespace npuzzle::solver
