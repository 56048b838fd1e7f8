#include "solver/solver_config.hh"

#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"
#include "solver/solver_config_to_proto.hh"

namespace npuzzle::solver {
namespace {
std::filesystem::path write_temp_file(const std::string &name, const std::string &contents) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream file_out(path, std::ios::binary | std::ios::out | std::ios::trunc);
    file_out << contents;
    return path;
}
}  // namespace

TEST(SolverConfigToProtoTest, pack_unpack) {
    // Setup
    const SolverConfig config{
        .depth_limit = 12,
        .default_algorithm = Algorithm::A_STAR,
        .shuffle_moves = 7,
        .check_solvability = false,
    };

    // Action
    proto::SolverConfig proto;
    pack_into(config, &proto);
    const SolverConfig unpacked = unpack_from(proto);

    // Verification
    EXPECT_EQ(proto.default_algorithm(), "A*");
    EXPECT_EQ(unpacked.depth_limit, config.depth_limit);
    EXPECT_EQ(unpacked.default_algorithm, config.default_algorithm);
    EXPECT_EQ(unpacked.shuffle_moves, config.shuffle_moves);
    EXPECT_EQ(unpacked.check_solvability, config.check_solvability);
}

TEST(SolverConfigToProtoTest, unset_fields_keep_defaults) {
    // Setup
    proto::SolverConfig proto;
    proto.set_depth_limit(3);

    // Action
    const SolverConfig unpacked = unpack_from(proto);

    // Verification
    EXPECT_EQ(unpacked.depth_limit, 3);
    EXPECT_EQ(unpacked.default_algorithm, Algorithm::BFS);
    EXPECT_EQ(unpacked.shuffle_moves, SolverConfig::DEFAULT_SHUFFLE_MOVES);
    EXPECT_TRUE(unpacked.check_solvability);
}

TEST(SolverConfigTest, load_text_format) {
    // Setup
    const auto path = write_temp_file("npuzzle_solver_config_text.pbtxt",
                                      "depth_limit: 20\ndefault_algorithm: \"DFS\"\n");

    // Action
    const auto maybe_config = load_solver_config(path);

    // Verification
    ASSERT_TRUE(maybe_config.has_value());
    EXPECT_EQ(maybe_config->depth_limit, 20);
    EXPECT_EQ(maybe_config->default_algorithm, Algorithm::DFS);
    EXPECT_EQ(maybe_config->shuffle_moves, SolverConfig::DEFAULT_SHUFFLE_MOVES);
    std::filesystem::remove(path);
}

TEST(SolverConfigTest, load_binary_format) {
    // Setup
    proto::SolverConfig proto;
    pack_into(SolverConfig{.shuffle_moves = 9, .check_solvability = false}, &proto);
    const auto path =
        write_temp_file("npuzzle_solver_config_binary.pb", proto.SerializeAsString());

    // Action
    const auto maybe_config = load_solver_config(path);

    // Verification
    ASSERT_TRUE(maybe_config.has_value());
    EXPECT_EQ(maybe_config->shuffle_moves, 9);
    EXPECT_FALSE(maybe_config->check_solvability);
    std::filesystem::remove(path);
}

TEST(SolverConfigTest, rejects_unknown_algorithm) {
    // Setup
    const auto path =
        write_temp_file("npuzzle_solver_config_bad.pbtxt", "default_algorithm: \"IDA*\"\n");

    // Action + Verification
    EXPECT_FALSE(load_solver_config(path).has_value());
    std::filesystem::remove(path);
}

TEST(SolverConfigTest, rejects_negative_depth_limit) {
    // Setup
    const auto path = write_temp_file("npuzzle_solver_config_negative.pbtxt", "depth_limit: -1\n");

    // Action + Verification
    EXPECT_FALSE(load_solver_config(path).has_value());
    std::filesystem::remove(path);
}

TEST(SolverConfigTest, negative_fields_are_reported) {
    // Setup
    const SolverConfig negative_depth{.depth_limit = -1};
    const SolverConfig negative_shuffle{.shuffle_moves = -5};

    // Action
    const auto maybe_depth_error = find_config_error(negative_depth);
    const auto maybe_shuffle_error = find_config_error(negative_shuffle);

    // Verification
    ASSERT_TRUE(maybe_depth_error.has_value());
    EXPECT_EQ(maybe_depth_error.value(), "depth_limit must be non-negative, got -1");
    ASSERT_TRUE(maybe_shuffle_error.has_value());
    EXPECT_EQ(maybe_shuffle_error.value(), "shuffle_moves must be non-negative, got -5");
    EXPECT_FALSE(find_config_error(SolverConfig{}).has_value());
    EXPECT_FALSE(find_config_error(SolverConfig{.depth_limit = 0}).has_value());
}

TEST(SolverConfigTest, missing_file) {
    EXPECT_FALSE(load_solver_config("/nonexistent/solver_config.pbtxt").has_value());
}
}  // namespace npuzzle::solver
