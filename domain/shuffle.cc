#include "domain/shuffle.hh"

namespace npuzzle::domain {
Board shuffle(const int size, const int num_moves, InOut<std::mt19937> gen) {
    Board board = Board::goal(size);
    for (int i = 0; i < num_moves; i++) {
        std::vector<Neighbor> candidates = neighbors(board);
        std::uniform_int_distribution<int> pick(0, static_cast<int>(candidates.size()) - 1);
        board = std::move(candidates.at(pick(*gen)).board);
    }
    return board;
}
}  // namespace npuzzle::domain
