#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "solver/algorithm.hh"

namespace npuzzle::solver {

struct SolverConfig {
    static constexpr int DEFAULT_DEPTH_LIMIT = 50;
    static constexpr int DEFAULT_SHUFFLE_MOVES = 50;

    int depth_limit = DEFAULT_DEPTH_LIMIT;
    Algorithm default_algorithm = Algorithm::BFS;
    int shuffle_moves = DEFAULT_SHUFFLE_MOVES;
    // Reject boards that fail the parity check before running a search.
    bool check_solvability = true;
};

// Describes the first out of range field, if any.
std::optional<std::string> find_config_error(const SolverConfig &config);

// Reads a SolverConfig stored as a binary or text format proto. Fields that are not set keep
// their default values.
std::optional<SolverConfig> load_solver_config(const std::filesystem::path &path);

}  // namespace npuzzle::solver
