#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include "cxxopts.hpp"
#include "domain/shuffle.hh"
#include "domain/sliding_puzzle.hh"
#include "fmt/core.h"
#include "nlohmann/json.hpp"
#include "solver/board_arg.hh"
#include "solver/solve.hh"
#include "solver/solve_json.hh"
#include "solver/solver_config.hh"

using json = nlohmann::json;

namespace npuzzle::solver {
namespace {
void print_response(const SolveResponse &response) {
    if (!response.result.has_value()) {
        fmt::print("{}: {}\n", wise_enum::to_string(response.status), response.message);
        return;
    }

    const SearchResult &result = response.result.value();
    if (!result.success) {
        fmt::print("{}: {}\n", to_string(result.algorithm), result.message);
    } else {
        for (int i = 0; i < static_cast<int>(result.solution_path.size()); i++) {
            fmt::print("Step {}:\n{}\n", i, domain::to_string(result.solution_path.at(i)));
        }
        fmt::print("Solution depth: {}\n", result.solution_depth);
    }
    fmt::print("Algorithm: {}\n", to_string(result.algorithm));
    fmt::print("Nodes expanded: {}\n", result.nodes_expanded);
    fmt::print("Max frontier size: {}\n", result.max_frontier_size);
    fmt::print("Time taken: {:.4f} s\n", result.elapsed.count());
}

int run_solve(const std::vector<std::vector<int>> &rows, const std::optional<std::string> &algorithm,
              const SolverConfig &config, const bool as_json) {
    const SolveResponse response =
        solve_request(SolveRequest{.board = rows, .algorithm = algorithm}, config);
    if (as_json) {
        std::cout << response_to_json(response).dump(2) << std::endl;
    } else {
        print_response(response);
    }
    return response.status == SolveStatus::SOLVED ? 0 : 1;
}

int run_request(const std::filesystem::path &request_path, const SolverConfig &config) {
    std::ifstream request_stream(request_path);
    if (!request_stream.is_open()) {
        std::cout << "Could not open request file: " << request_path << std::endl;
        return 1;
    }

    json body;
    try {
        body = json::parse(request_stream);
    } catch (const json::parse_error &e) {
        std::cout << json{{"success", false}, {"error", e.what()}}.dump(2) << std::endl;
        return 1;
    }

    const json response = handle_solve_json(body, config);
    std::cout << response.dump(2) << std::endl;
    return response["success"].get<bool>() ? 0 : 1;
}

int run_compare(const std::vector<std::vector<int>> &rows, const SolverConfig &config) {
    fmt::print("{:<12} {:<8} {:<15} {:<12} {:<10}\n", "Algorithm", "Depth", "Nodes", "Time (s)",
               "Optimal");
    fmt::print("{}\n", std::string(60, '-'));
    bool all_solved = true;
    for (const auto &[algorithm, _] : wise_enum::range<Algorithm>) {
        const SolveResponse response = solve_request(
            SolveRequest{.board = rows, .algorithm = to_string(algorithm)}, config);
        if (response.status != SolveStatus::SOLVED) {
            fmt::print("{:<12} {}\n", to_string(algorithm), response.message);
            all_solved = false;
            continue;
        }
        const SearchResult &result = response.result.value();
        fmt::print("{:<12} {:<8} {:<15} {:<12.4f} {:<10}\n", to_string(algorithm),
                   result.solution_depth, result.nodes_expanded, result.elapsed.count(),
                   algorithm == Algorithm::DFS ? "No" : "Yes");
    }
    return all_solved ? 0 : 1;
}

int run_shuffle(const int size, const unsigned int seed, const SolverConfig &config,
                const bool as_json) {
    if (size < domain::Board::MIN_SIZE || size > domain::Board::MAX_SIZE) {
        std::cout << "Only 2x2 and 3x3 puzzles are supported, got size " << size << std::endl;
        return 1;
    }
    std::mt19937 gen(seed);
    const domain::Board board = domain::shuffle(size, config.shuffle_moves, make_in_out(gen));
    if (as_json) {
        std::cout << board_to_json(board).dump() << std::endl;
    } else {
        std::cout << domain::to_string(board);
    }
    return 0;
}
}  // namespace
}  // namespace npuzzle::solver

int main(int argc, char **argv) {
    using namespace npuzzle::solver;
    cxxopts::Options options("puzzle_solver",
                             "Solve 2x2 and 3x3 sliding tile puzzles with BFS, DFS or A*");
    options.add_options()("board", "Row-major comma separated cells, 0 is the blank",
                          cxxopts::value<std::string>())(
        "algorithm", "One of BFS, DFS or A*", cxxopts::value<std::string>())(
        "config", "SolverConfig proto in text or binary format", cxxopts::value<std::string>())(
        "depth_limit", "Depth limit for DFS", cxxopts::value<int>())(
        "request", "File containing a JSON solve request", cxxopts::value<std::string>())(
        "compare", "Solve the board with every algorithm")(
        "shuffle", "Print a randomly shuffled board")(
        "size", "Board size used by --shuffle", cxxopts::value<int>()->default_value("3"))(
        "seed", "Random seed used by --shuffle", cxxopts::value<unsigned int>())(
        "json", "Print JSON instead of text")("h,help", "Print usage");

    auto args = options.parse(argc, argv);

    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    SolverConfig config;
    if (args.count("config")) {
        const auto maybe_config = load_solver_config(args["config"].as<std::string>());
        if (!maybe_config.has_value()) {
            return 1;
        }
        config = maybe_config.value();
    }
    if (args.count("depth_limit")) {
        config.depth_limit = args["depth_limit"].as<int>();
    }
    if (const auto maybe_error = find_config_error(config); maybe_error.has_value()) {
        std::cout << maybe_error.value() << std::endl;
        return 1;
    }

    if (args.count("shuffle")) {
        const unsigned int seed =
            args.count("seed") ? args["seed"].as<unsigned int>() : std::random_device{}();
        return run_shuffle(args["size"].as<int>(), seed, config, args.count("json") > 0);
    }

    if (args.count("request")) {
        return run_request(args["request"].as<std::string>(), config);
    }

    if (!args.count("board")) {
        std::cout << "Missing board" << std::endl;
        std::cout << options.help() << std::endl;
        return 1;
    }

    const auto rows_or_error = parse_board_arg(args["board"].as<std::string>());
    if (std::holds_alternative<std::string>(rows_or_error)) {
        std::cout << std::get<std::string>(rows_or_error) << std::endl;
        return 1;
    }
    const auto &rows = std::get<std::vector<std::vector<int>>>(rows_or_error);

    if (args.count("compare")) {
        return run_compare(rows, config);
    }

    const std::optional<std::string> algorithm =
        args.count("algorithm") ? std::make_optional(args["algorithm"].as<std::string>())
                                : std::nullopt;
    return run_solve(rows, algorithm, config, args.count("json") > 0);
}
