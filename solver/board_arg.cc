#include "solver/board_arg.hh"

#include <cmath>
#include <stdexcept>

#include "fmt/format.h"

namespace npuzzle::solver {

std::vector<std::string> split_on(const std::string &str, const char delim) {
    std::vector<std::string> parts = {};
    auto part_start_iter = str.begin();
    for (auto iter = str.begin(); iter != str.end(); ++iter) {
        if (*iter == delim) {
            parts.push_back(std::string(part_start_iter, iter));
            part_start_iter = iter + 1;
        }
    }
    parts.push_back(std::string(part_start_iter, str.end()));
    return parts;
}

std::variant<std::vector<std::vector<int>>, std::string> parse_board_arg(
    const std::string &board_str) {
    std::vector<int> cells;
    for (const auto &part : split_on(board_str, ',')) {
        std::size_t num_parsed = 0;
        int value = 0;
        try {
            value = std::stoi(part, &num_parsed);
        } catch (const std::logic_error &) {
            return fmt::format("Invalid cell value: '{}'", part);
        }
        // std::stoi stops at the first character that isn't part of the number
        if (num_parsed != part.size()) {
            return fmt::format("Invalid cell value: '{}'", part);
        }
        cells.push_back(value);
    }

    const int size = std::lround(std::sqrt(cells.size()));
    if (size * size != static_cast<int>(cells.size())) {
        return fmt::format("Board must have a square number of cells, got {}", cells.size());
    }

    std::vector<std::vector<int>> rows;
    for (int row = 0; row < size; row++) {
        rows.emplace_back(cells.begin() + row * size, cells.begin() + (row + 1) * size);
    }
    return rows;
}

}  // namespace npuzzle::solver
