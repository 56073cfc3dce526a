#pragma once

#include "numeric/numeric_config.hpp"

#include <gmpxx.h>
#include <string>
#include <utility>

namespace vdc {

// ─── Rational ──────────────────────────────────────────────────
// Exact rationals backed by GMP. Every k, l, α and β value in the
// engine is one of these; nothing is ever compared approximately.

using Rational = mpq_class;

/// Deduplication key of an exponent pair: (k, l), ordered lexicographically.
using PairKey = std::pair<Rational, Rational>;

/// Parse "p/q", "p" or "-p/q". Throws std::invalid_argument on malformed input
/// or a zero denominator.
Rational parseRational(const std::string& text);

/// Canonical form: "p/q", or "p" when the denominator is 1.
std::string toString(const Rational& q);

/// Decimal rendering at the configured precision.
std::string toDecimalString(const Rational& q, const NumericConfig& config);

} // namespace vdc
