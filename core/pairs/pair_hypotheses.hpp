#pragma once

#include "kb/hypothesis.hpp"

#include <string>
#include <vector>

namespace vdc {

// ─── Exponent pair constructors ────────────────────────────────

/// An exponent pair cited from the literature.
HypothesisPtr literatureExpPair(const Rational& k, const Rational& l, const Reference& ref);

/// An exponent pair derived inside the engine, dated by its latest dependency.
HypothesisPtr derivedExpPair(const Rational& k, const Rational& l, const std::string& proof,
                             const std::vector<HypothesisPtr>& dependencies);

/// (0, 1), from the triangle inequality.
HypothesisPtr trivialExpPair();

/// (0, 0), the exponent pair conjecture.
HypothesisPtr exponentPairConjecture();

} // namespace vdc
