#pragma once

#include "assert/assert.hpp"

#define NPUZZLE_CHECK(expr, ...) \
    ASSERT_INVOKE(expr, false, true, "NPUZZLE_CHECK", verification, , __VA_ARGS__)

namespace npuzzle {
using check_failure = libassert::verification_failure;
}
