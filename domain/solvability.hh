#pragma once

#include "domain/sliding_puzzle.hh"

namespace npuzzle::domain {

struct Solvability {
    bool is_solvable;
    // Pairs of tiles, ignoring the blank, that appear in decreasing order in the row-major
    // sequence.
    int inversions;
    // Row of the blank counted from the bottom row, starting at 1.
    int blank_row_from_bottom;
};

int count_inversions(const Board &board);

// Decides whether the goal is reachable from `board` using inversion parity. For odd widths the
// inversion parity is invariant under moves. For even widths a vertical move flips the inversion
// parity and shifts the blank by one row, so the parity of inversions + blank_row_from_bottom is
// invariant instead. A board is solvable iff its invariant matches the goal's.
Solvability check_solvability(const Board &board);

}  // namespace npuzzle::domain
