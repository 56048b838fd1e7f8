#include "domain/solvability.hh"

namespace npuzzle::domain {
namespace {
int parity_invariant(const Board &board, const int inversions) {
    if (board.size() % 2 == 1) {
        return inversions % 2;
    }
    const int blank_row_from_bottom = board.size() - board.blank_row();
    return (inversions + blank_row_from_bottom) % 2;
}
}  // namespace

int count_inversions(const Board &board) {
    std::vector<int> tiles;
    tiles.reserve(board.cells().size());
    for (const int value : board.cells()) {
        if (value != Board::BLANK) {
            tiles.push_back(value);
        }
    }

    int inversions = 0;
    for (int i = 0; i < static_cast<int>(tiles.size()); i++) {
        for (int j = i + 1; j < static_cast<int>(tiles.size()); j++) {
            if (tiles.at(i) > tiles.at(j)) {
                inversions++;
            }
        }
    }
    return inversions;
}

Solvability check_solvability(const Board &board) {
    const Board goal = Board::goal(board.size());
    const int inversions = count_inversions(board);
    const int goal_parity = parity_invariant(goal, count_inversions(goal));
    return Solvability{
        .is_solvable = parity_invariant(board, inversions) == goal_parity,
        .inversions = inversions,
        .blank_row_from_bottom = board.size() - board.blank_row(),
    };
}

}  // namespace npuzzle::domain
