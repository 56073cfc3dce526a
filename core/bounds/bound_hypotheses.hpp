#pragma once

#include "kb/hypothesis_set.hpp"

#include <string>
#include <vector>

namespace vdc {

/// A bound on β cited from the literature.
HypothesisPtr literatureBetaBound(const BetaBound& bound, const Reference& ref);

/// A bound on β derived from other hypotheses.
HypothesisPtr derivedBetaBound(const BetaBound& bound, const std::string& proof,
                               const std::vector<HypothesisPtr>& dependencies);

/// The β-bound pieces of `set` that no other piece dominates, ordered by
/// domain (x0, then x1). Of two identical pieces the earlier one is kept.
/// Overlapping pieces that neither dominates are both returned.
std::vector<HypothesisPtr> bestBetaBounds(const HypothesisSet& set);

} // namespace vdc
