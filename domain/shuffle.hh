#pragma once

#include <random>

#include "common/argument_wrapper.hh"
#include "domain/sliding_puzzle.hh"

namespace npuzzle::domain {
// Starting from the goal, moves the blank `num_moves` times in uniformly random legal
// directions. Since every move is reversible, the result is always solvable.
Board shuffle(const int size, const int num_moves, InOut<std::mt19937> gen);
}  // namespace npuzzle::domain
