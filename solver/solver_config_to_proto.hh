#pragma once

#include "solver/solver_config.hh"
#include "solver/solver_config.pb.h"

namespace npuzzle::solver::proto {
void pack_into(const solver::SolverConfig &in, SolverConfig *out);
solver::SolverConfig unpack_from(const SolverConfig &in);
}  // namespace npuzzle::solver::proto
