#pragma once

#include "kb/hypothesis_set.hpp"

#include <vector>

namespace vdc {

/// Convex hull of the exponent pairs in `set`, as the vertex hypotheses in
/// counter-clockwise order. With fewer than three pairs the hull is all of
/// them. The result is cached on the set and reused until an insertion
/// clears set.dataValid().
const std::vector<HypothesisPtr>& computeConvexHull(HypothesisSet& set);

} // namespace vdc
