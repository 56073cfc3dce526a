#pragma once

#include "numeric/rational.hpp"

#include <string>
#include <vector>

namespace vdc {

/// Sub-interval of α. Endpoints may be open or closed.
struct Interval {
    Rational x0;
    Rational x1;
    bool include_lower = true;
    bool include_upper = true;

    Interval() = default;
    Interval(Rational x0, Rational x1, bool include_lower = true, bool include_upper = true);

    bool contains(const Rational& x) const;

    /// True when every point of `other` lies in this interval.
    bool covers(const Interval& other) const;
};

/// One piece of a piecewise upper bound β(α) ≤ P(α) valid on `domain`,
/// where P is a polynomial with rational coefficients (constant term first).
class BetaBound {
public:
    BetaBound(Interval domain, std::vector<Rational> coefficients);

    /// Convenience for the affine piece β(α) ≤ slope·α + intercept.
    static BetaBound affine(Interval domain, const Rational& slope, const Rational& intercept);

    const Interval& domain() const { return domain_; }
    const std::vector<Rational>& coefficients() const { return coefficients_; }

    /// Evaluate at x. Outside the domain this throws std::domain_error unless
    /// extend_domain is set, in which case the polynomial's continuation is used.
    Rational at(const Rational& x, bool extend_domain = false) const;

    /// True when this piece applies wherever `other` does and is no larger there.
    /// Decided from the Bernstein coefficients of the difference on other's
    /// domain: exact for affine pieces, conservative (may say false) above that.
    bool dominates(const BetaBound& other) const;

    /// "β(α) ≤ <poly> for α ∈ [x0, x1)".
    std::string toString() const;

private:
    Interval domain_;
    std::vector<Rational> coefficients_;
};

} // namespace vdc
