#pragma once

#include "kb/hypothesis_set.hpp"
#include "search/search_config.hpp"

#include <vector>

namespace vdc {

/// Expand the exponent pairs of `set` under its registered transforms.
///
/// Each round applies every transform, in set order, to a snapshot of the
/// pairs known at that moment, so a later transform in the round sees the
/// output of an earlier one. With pruning on and at least three pairs, the
/// working set is then cut down to its convex hull vertices.
///
/// Returns the distinct-keyed pairs (existing hypotheses reused by pointer).
/// Throws std::invalid_argument for a negative search depth.
std::vector<HypothesisPtr> computeExpPairs(const HypothesisSet& set,
                                           const ClosureConfig& config = ClosureConfig{});

} // namespace vdc
