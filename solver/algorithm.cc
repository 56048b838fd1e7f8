#include "solver/algorithm.hh"

namespace npuzzle::solver {

std::string to_string(const Algorithm algorithm) {
    if (algorithm == Algorithm::A_STAR) {
        return "A*";
    }
    return std::string(wise_enum::to_string(algorithm));
}

std::optional<Algorithm> algorithm_from_string(std::string_view name) {
    if (name == "A*") {
        return Algorithm::A_STAR;
    }
    const auto maybe_algorithm = wise_enum::from_string<Algorithm>(name);
    if (!maybe_algorithm) {
        return std::nullopt;
    }
    return *maybe_algorithm;
}

}  // namespace npuzzle::solver
