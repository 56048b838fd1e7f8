#include "solver/solver_config_to_proto.hh"

#include "common/check.hh"

namespace npuzzle::solver::proto {
void pack_into(const solver::SolverConfig &in, SolverConfig *out) {
    out->set_depth_limit(in.depth_limit);
    out->set_default_algorithm(to_string(in.default_algorithm));
    out->set_shuffle_moves(in.shuffle_moves);
    out->set_check_solvability(in.check_solvability);
}

solver::SolverConfig unpack_from(const SolverConfig &in) {
    solver::SolverConfig out;
    if (in.has_depth_limit()) {
        out.depth_limit = in.depth_limit();
    }
    if (in.has_default_algorithm()) {
        const auto maybe_algorithm = algorithm_from_string(in.default_algorithm());
        NPUZZLE_CHECK(maybe_algorithm.has_value(), "Unknown algorithm", in.default_algorithm());
        out.default_algorithm = maybe_algorithm.value();
    }
    if (in.has_shuffle_moves()) {
        out.shuffle_moves = in.shuffle_moves();
    }
    if (in.has_check_solvability()) {
        out.check_solvability = in.check_solvability();
    }
    return out;
}
}  // namespace npuzzle::solver::proto
