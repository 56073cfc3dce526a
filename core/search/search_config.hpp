#pragma once

#include "numeric/numeric_config.hpp"

namespace vdc {

/// Closure engine parameters.
struct ClosureConfig {
    int search_depth = 5;   // rounds of transform application
    // Keep only hull vertices after each round. Assumes an interior point
    // never becomes a vertex under further transforms; a new transform
    // family may break this.
    bool prune = true;
};

/// Read-only configuration threaded through the proof search.
struct EngineConfig {
    ClosureConfig closure;
    NumericConfig numeric;
};

} // namespace vdc
