#include "solver/solver_config.hh"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "fmt/format.h"
#include "google/protobuf/text_format.h"
#include "solver/solver_config_to_proto.hh"

namespace npuzzle::solver {
namespace {
std::optional<proto::SolverConfig> parse_config_proto(const std::string &contents) {
    proto::SolverConfig out;
    if (google::protobuf::TextFormat::ParseFromString(contents, &out)) {
        return out;
    }
    out.Clear();
    if (out.ParseFromString(contents)) {
        return out;
    }
    return std::nullopt;
}
}  // namespace

std::optional<std::string> find_config_error(const SolverConfig &config) {
    if (config.depth_limit < 0) {
        return fmt::format("depth_limit must be non-negative, got {}", config.depth_limit);
    }
    if (config.shuffle_moves < 0) {
        return fmt::format("shuffle_moves must be non-negative, got {}", config.shuffle_moves);
    }
    return std::nullopt;
}

std::optional<SolverConfig> load_solver_config(const std::filesystem::path &path) {
    if (!std::filesystem::exists(path)) {
        fmt::print(stderr, "Solver config {} does not exist\n", path.string());
        return std::nullopt;
    }

    std::ifstream file_in(path, std::ios::binary | std::ios::in);
    std::stringstream sstream;
    sstream << file_in.rdbuf();

    const auto maybe_proto = parse_config_proto(sstream.str());
    if (!maybe_proto.has_value()) {
        fmt::print(stderr, "Couldn't parse {} as a text or binary SolverConfig\n", path.string());
        return std::nullopt;
    }

    const proto::SolverConfig &config_proto = maybe_proto.value();
    if (config_proto.has_default_algorithm() &&
        !algorithm_from_string(config_proto.default_algorithm()).has_value()) {
        fmt::print(stderr, "Unknown default algorithm: {}\n", config_proto.default_algorithm());
        return std::nullopt;
    }
    const SolverConfig config = proto::unpack_from(config_proto);
    if (const auto maybe_error = find_config_error(config); maybe_error.has_value()) {
        fmt::print(stderr, "Invalid SolverConfig in {}: {}\n", path.string(), maybe_error.value());
        return std::nullopt;
    }
    return config;
}

}  // namespace npuzzle::solver
