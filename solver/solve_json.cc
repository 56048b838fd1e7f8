#include "solver/solve_json.hh"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "fmt/format.h"

using json = nlohmann::json;

namespace npuzzle::solver {
namespace {
constexpr double TIME_RESOLUTION_S = 1e-4;

SolveResponse malformed_request(const std::string &message) {
    return SolveResponse{
        .status = SolveStatus::MALFORMED_BOARD,
        .algorithm = "",
        .size = std::nullopt,
        .solvability = std::nullopt,
        .result = std::nullopt,
        .message = message,
    };
}

// JSON integers are 64 bit, so a cell can hold a value that doesn't survive conversion to int.
bool fits_in_int(const json &cell) {
    if (cell.is_number_unsigned()) {
        return cell.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    const std::int64_t value = cell.get<std::int64_t>();
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

double round_time(const std::chrono::duration<double> &elapsed) {
    return std::round(elapsed.count() / TIME_RESOLUTION_S) * TIME_RESOLUTION_S;
}
}  // namespace

std::variant<SolveRequest, SolveResponse> request_from_json(const json &body) {
    if (!body.is_object() || !body.contains("board")) {
        return malformed_request("Request must contain a board.");
    }

    const auto &board_json = body["board"];
    if (!board_json.is_array()) {
        return malformed_request("The board must be a list of rows.");
    }

    SolveRequest request;
    for (const auto &row_json : board_json) {
        if (!row_json.is_array()) {
            return malformed_request("The board must be a list of rows.");
        }
        std::vector<int> row;
        for (const auto &cell : row_json) {
            if (!cell.is_number_integer()) {
                return malformed_request(
                    fmt::format("Invalid value: {}. Cells must be integers.", cell.dump()));
            }
            if (!fits_in_int(cell)) {
                return malformed_request(
                    fmt::format("Invalid value: {}. Value is out of range.", cell.dump()));
            }
            row.push_back(cell.get<int>());
        }
        request.board.push_back(std::move(row));
    }

    if (body.contains("algorithm")) {
        const auto &algorithm_json = body["algorithm"];
        if (!algorithm_json.is_string()) {
            return SolveResponse{
                .status = SolveStatus::UNKNOWN_ALGORITHM,
                .algorithm = algorithm_json.dump(),
                .size = std::nullopt,
                .solvability = std::nullopt,
                .result = std::nullopt,
                .message = fmt::format("Unknown algorithm: {}", algorithm_json.dump()),
            };
        }
        request.algorithm = algorithm_json.get<std::string>();
    }
    return request;
}

json board_to_json(const domain::Board &board) { return board.to_rows(); }

json response_to_json(const SolveResponse &response) {
    json out;
    out["success"] = response.status == SolveStatus::SOLVED;
    out["status"] = std::string(wise_enum::to_string(response.status));
    out["algorithm"] = response.algorithm;
    if (response.size.has_value()) {
        out["size"] = response.size.value();
    }
    if (response.solvability.has_value()) {
        out["inversions"] = response.solvability->inversions;
        out["blank_row_from_bottom"] = response.solvability->blank_row_from_bottom;
    }

    if (!response.result.has_value()) {
        out["error"] = response.message;
        return out;
    }

    const SearchResult &result = response.result.value();
    out["algorithm"] = to_string(result.algorithm);
    if (result.success) {
        json path = json::array();
        for (const auto &board : result.solution_path) {
            path.push_back(board_to_json(board));
        }
        out["solution_path"] = std::move(path);
        out["solution_depth"] = result.solution_depth;
    } else {
        out["message"] = result.message;
    }
    out["nodes_expanded"] = result.nodes_expanded;
    out["time_taken"] = round_time(result.elapsed);
    const char *frontier_key =
        result.algorithm == Algorithm::DFS ? "max_stack_size" : "max_queue_size";
    out[frontier_key] = result.max_frontier_size;
    return out;
}

json handle_solve_json(const json &body, const SolverConfig &config) {
    const auto request_or_response = request_from_json(body);
    if (std::holds_alternative<SolveResponse>(request_or_response)) {
        return response_to_json(std::get<SolveResponse>(request_or_response));
    }
    return response_to_json(solve_request(std::get<SolveRequest>(request_or_response), config));
}

}  // namespace npuzzle::solver
