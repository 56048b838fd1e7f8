#pragma once

#include <string>
#include <variant>
#include <vector>

namespace npuzzle::solver {

std::vector<std::string> split_on(const std::string &str, const char delim);

// Parses a row-major, comma separated list of cells such as "1,2,3,4,0,6,7,5,8" into rows.
// Returns a message describing the problem if a cell is not an integer or the number of cells
// is not a perfect square. The values themselves are validated by `parse_board`.
std::variant<std::vector<std::vector<int>>, std::string> parse_board_arg(
    const std::string &board_str);

}  // namespace npuzzle::solver
