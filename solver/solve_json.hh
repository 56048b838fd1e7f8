#pragma once

#include <variant>

#include "domain/sliding_puzzle.hh"
#include "nlohmann/json.hpp"
#include "solver/solve.hh"
#include "solver/solver_config.hh"

namespace npuzzle::solver {

// Reads a body of the form {"board": [[1, 2, 3], [4, 0, 6], [7, 5, 8]], "algorithm": "A*"}.
// If the body can't be interpreted as a request, the response to send back is returned instead.
std::variant<SolveRequest, SolveResponse> request_from_json(const nlohmann::json &body);

nlohmann::json board_to_json(const domain::Board &board);

nlohmann::json response_to_json(const SolveResponse &response);

// Parses the body, solves the puzzle and serializes the response.
nlohmann::json handle_solve_json(const nlohmann::json &body, const SolverConfig &config = {});

}  // namespace npuzzle::solver
