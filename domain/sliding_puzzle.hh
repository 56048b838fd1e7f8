#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "wise_enum.h"

namespace npuzzle::domain {

// The direction in which the blank moves.
WISE_ENUM_CLASS(Move, UP, DOWN, LEFT, RIGHT)

// A square sliding tile board stored in row-major order. The value 0 denotes the blank.
class Board {
   public:
    static constexpr int MIN_SIZE = 2;
    static constexpr int MAX_SIZE = 3;
    static constexpr int BLANK = 0;

    // Fails a check if `cells` is not a permutation of 0..size*size-1.
    Board(const int size, std::vector<int> cells);

    static Board goal(const int size);

    int size() const { return size_; }
    const std::vector<int> &cells() const { return cells_; }
    int at(const int row, const int col) const { return cells_.at(row * size_ + col); }

    // Linear index of the blank.
    int blank_index() const { return blank_idx_; }
    int blank_row() const { return blank_idx_ / size_; }
    int blank_col() const { return blank_idx_ % size_; }

    // Packs the cells, 4 bits each, into a single integer. Distinct boards of the same size
    // produce distinct keys.
    std::uint64_t key() const;

    std::vector<std::vector<int>> to_rows() const;

    bool operator==(const Board &other) const {
        return size_ == other.size_ && cells_ == other.cells_;
    }

    template <typename H>
    friend H AbslHashValue(H h, const Board &board) {
        return H::combine(std::move(h), board.size_, board.key());
    }

   private:
    int size_;
    std::vector<int> cells_;
    int blank_idx_;
};

struct Neighbor {
    Move move;
    Board board;
};

WISE_ENUM_CLASS(BoardErrorType, MALFORMED_BOARD, UNSUPPORTED_SIZE)

struct BoardError {
    BoardErrorType type;
    // Dimension of the rejected input, i.e. its number of rows.
    int size;
    std::string message;
};

// Validates untrusted rows and builds a board from them.
std::variant<Board, BoardError> parse_board(const std::vector<std::vector<int>> &rows);

bool is_goal(const Board &board);

// Sum over the tiles of the row and column offsets between `board` and `goal`. The blank is
// not counted, which keeps the estimate admissible and consistent.
int manhattan_distance(const Board &board, const Board &goal);

// Boards reachable by a single move of the blank, in the order UP, DOWN, LEFT, RIGHT.
std::vector<Neighbor> neighbors(const Board &board);

// Returns the board produced by moving the blank, or nothing if the move leaves the grid.
std::optional<Board> apply_move(const Board &board, const Move move);

std::string to_string(const Board &board);

}  // namespace npuzzle::domain
