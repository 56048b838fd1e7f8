#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "wise_enum.h"

namespace npuzzle::solver {

WISE_ENUM_CLASS(Algorithm, BFS, DFS, A_STAR)

// Returns "BFS", "DFS" or "A*".
std::string to_string(const Algorithm algorithm);

// Accepts the names produced by `to_string` as well as the enumerator names.
std::optional<Algorithm> algorithm_from_string(std::string_view name);

}  // namespace npuzzle::solver
