#include "domain/sliding_puzzle.hh"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "common/check.hh"
#include "fmt/format.h"

namespace npuzzle::domain {
namespace {
constexpr int BITS_PER_CELL = 4;

struct Offset {
    int d_row;
    int d_col;
};

constexpr Offset offset_for_move(const Move move) {
    switch (move) {
        case Move::UP:
            return {-1, 0};
        case Move::DOWN:
            return {1, 0};
        case Move::LEFT:
            return {0, -1};
        case Move::RIGHT:
            return {0, 1};
    }
    return {0, 0};
}

// Returns a description of the first problem found with the cells, if any.
std::optional<std::string> find_cell_error(const int size, const std::vector<int> &cells) {
    const int num_cells = size * size;
    if (static_cast<int>(cells.size()) != num_cells) {
        return fmt::format("Expected {} cells for a {}x{} board, got {}.", num_cells, size, size,
                           cells.size());
    }

    const int max_value = num_cells - 1;
    int blank_count = 0;
    for (const int value : cells) {
        if (value < 0 || value > max_value) {
            return fmt::format("Invalid value: {}. Must be between 0 and {}.", value, max_value);
        }
        if (value == Board::BLANK) {
            blank_count++;
        }
    }

    if (blank_count != 1) {
        return fmt::format("Puzzle must have exactly one empty tile (0). Found {}.", blank_count);
    }

    std::vector<bool> seen(num_cells, false);
    for (const int value : cells) {
        if (seen.at(value)) {
            return fmt::format(
                "Missing or duplicate values. Puzzle must contain all numbers from 0 to {}.",
                max_value);
        }
        seen.at(value) = true;
    }
    return std::nullopt;
}
}  // namespace

Board::Board(const int size, std::vector<int> cells) : size_(size), cells_(std::move(cells)) {
    NPUZZLE_CHECK(size_ >= MIN_SIZE && size_ <= MAX_SIZE, "Unsupported board size", size_);
    const auto maybe_error = find_cell_error(size_, cells_);
    NPUZZLE_CHECK(!maybe_error.has_value(), "Invalid board cells", maybe_error.value_or(""));
    blank_idx_ = std::distance(cells_.begin(), std::find(cells_.begin(), cells_.end(), BLANK));
}

Board Board::goal(const int size) {
    std::vector<int> cells(size * size);
    for (int i = 0; i < static_cast<int>(cells.size()) - 1; i++) {
        cells.at(i) = i + 1;
    }
    cells.back() = BLANK;
    return Board(size, std::move(cells));
}

std::uint64_t Board::key() const {
    std::uint64_t out = 0;
    for (const int value : cells_) {
        out = (out << BITS_PER_CELL) | static_cast<std::uint64_t>(value);
    }
    return out;
}

std::vector<std::vector<int>> Board::to_rows() const {
    std::vector<std::vector<int>> rows;
    rows.reserve(size_);
    for (int row = 0; row < size_; row++) {
        rows.emplace_back(cells_.begin() + row * size_, cells_.begin() + (row + 1) * size_);
    }
    return rows;
}

std::variant<Board, BoardError> parse_board(const std::vector<std::vector<int>> &rows) {
    const int size = rows.size();
    if (size < Board::MIN_SIZE || size > Board::MAX_SIZE) {
        return BoardError{
            .type = BoardErrorType::UNSUPPORTED_SIZE,
            .size = size,
            .message = fmt::format(
                "Invalid puzzle size. Only 2x2 and 3x3 puzzles are supported. Got {}x{}.", size,
                size),
        };
    }

    std::vector<int> cells;
    cells.reserve(size * size);
    for (const auto &row : rows) {
        if (static_cast<int>(row.size()) != size) {
            return BoardError{
                .type = BoardErrorType::MALFORMED_BOARD,
                .size = size,
                .message =
                    fmt::format("Invalid puzzle: All rows must have the same size ({}).", size),
            };
        }
        cells.insert(cells.end(), row.begin(), row.end());
    }

    if (const auto maybe_error = find_cell_error(size, cells); maybe_error.has_value()) {
        return BoardError{
            .type = BoardErrorType::MALFORMED_BOARD,
            .size = size,
            .message = maybe_error.value(),
        };
    }
    return Board(size, std::move(cells));
}

bool is_goal(const Board &board) { return board == Board::goal(board.size()); }

int manhattan_distance(const Board &board, const Board &goal) {
    NPUZZLE_CHECK(board.size() == goal.size(), "Board sizes differ", board.size(), goal.size());
    const int size = board.size();
    const int num_cells = size * size;

    // position of each value in the goal
    std::vector<int> goal_idx_from_value(num_cells);
    for (int i = 0; i < num_cells; i++) {
        goal_idx_from_value.at(goal.cells().at(i)) = i;
    }

    int distance = 0;
    for (int i = 0; i < num_cells; i++) {
        const int value = board.cells().at(i);
        if (value == Board::BLANK) {
            continue;
        }
        const int goal_idx = goal_idx_from_value.at(value);
        distance += std::abs(i / size - goal_idx / size) + std::abs(i % size - goal_idx % size);
    }
    return distance;
}

std::optional<Board> apply_move(const Board &board, const Move move) {
    const auto [d_row, d_col] = offset_for_move(move);
    const int new_row = board.blank_row() + d_row;
    const int new_col = board.blank_col() + d_col;
    if (new_row < 0 || new_row >= board.size() || new_col < 0 || new_col >= board.size()) {
        return std::nullopt;
    }

    std::vector<int> cells = board.cells();
    std::swap(cells.at(board.blank_index()), cells.at(new_row * board.size() + new_col));
    return Board(board.size(), std::move(cells));
}

std::vector<Neighbor> neighbors(const Board &board) {
    std::vector<Neighbor> out;
    for (const auto &[move, _] : wise_enum::range<Move>) {
        auto maybe_board = apply_move(board, move);
        if (maybe_board.has_value()) {
            out.push_back({.move = move, .board = std::move(maybe_board.value())});
        }
    }
    return out;
}

std::string to_string(const Board &board) {
    std::stringstream out;
    for (int row = 0; row < board.size(); row++) {
        for (int col = 0; col < board.size(); col++) {
            const int value = board.at(row, col);
            if (value == Board::BLANK) {
                out << "_";
            } else {
                out << value;
            }
            out << (col + 1 < board.size() ? " " : "\n");
        }
    }
    return out.str();
}

}  // namespace npuzzle::domain
