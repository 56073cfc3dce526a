#pragma once

#include "kb/hypothesis_set.hpp"

#include <vector>

namespace vdc {

/// Exponent pairs implied by the β-bounds in `set`.
///
/// The bounds must cover α ∈ [0, 1/2]; otherwise nothing can be derived and
/// the result is empty. Each edge of the convex hull of the bound's boundary
/// points (plus the anchors (0, 0) and (1/2, 0)) lies on a tangent line
/// β = mα + c, which gives the exponent pair (k, l) = (c, m + c). Edges along
/// β = 0, α = 0, α = 1/2, or any other vertical line carry no information.
///
/// Every new pair cites all bound pieces touching a hull vertex. If the set
/// holds a "van der Corput B transform", each derived or reused pair is also
/// mirrored through it to cover α > 1/2.
///
/// Returns the set's existing exponent pairs followed by the new ones.
std::vector<HypothesisPtr> betaBoundsToExponentPairs(const HypothesisSet& set);

} // namespace vdc
