#pragma once

#include "numeric/rational.hpp"

#include <string>

namespace vdc {

/// An exponent pair (k, l) in the sense of Graham and Kolesnik, with
/// epsilon losses allowed. Equality is exact equality of both coordinates.
struct ExponentPair {
    Rational k;
    Rational l;

    ExponentPair() = default;
    ExponentPair(Rational k, Rational l) : k(std::move(k)), l(std::move(l)) {}

    PairKey key() const { return {k, l}; }

    /// "(k, l)" in exact form.
    std::string toString() const;

    bool operator==(const ExponentPair& other) const {
        return k == other.k && l == other.l;
    }
    bool operator!=(const ExponentPair& other) const { return !(*this == other); }
};

} // namespace vdc
