#include "bounds/beta_bound.hpp"

#include <algorithm>
#include <stdexcept>

namespace vdc {

namespace {

Rational binomial(size_t n, size_t k) {
    Rational r(1);
    for (size_t i = 1; i <= k; i++) {
        r *= Rational(static_cast<unsigned long>(n - k + i));
        r /= Rational(static_cast<unsigned long>(i));
    }
    return r;
}

} // namespace

Interval::Interval(Rational x0, Rational x1, bool include_lower, bool include_upper)
    : x0(std::move(x0)), x1(std::move(x1)),
      include_lower(include_lower), include_upper(include_upper) {
    if (this->x1 < this->x0) {
        throw std::invalid_argument("Interval endpoints out of order: [" +
            toString(this->x0) + ", " + toString(this->x1) + "]");
    }
}

bool Interval::contains(const Rational& x) const {
    if (x < x0 || x > x1) return false;
    if (x == x0 && !include_lower) return false;
    if (x == x1 && !include_upper) return false;
    return true;
}

bool Interval::covers(const Interval& other) const {
    if (other.x0 < x0 || other.x1 > x1) return false;
    if (other.x0 == x0 && other.include_lower && !include_lower) return false;
    if (other.x1 == x1 && other.include_upper && !include_upper) return false;
    return true;
}

BetaBound::BetaBound(Interval domain, std::vector<Rational> coefficients)
    : domain_(std::move(domain)), coefficients_(std::move(coefficients)) {
    if (coefficients_.empty()) {
        coefficients_.push_back(Rational(0));
    }
}

BetaBound BetaBound::affine(Interval domain, const Rational& slope, const Rational& intercept) {
    return BetaBound(std::move(domain), {intercept, slope});
}

Rational BetaBound::at(const Rational& x, bool extend_domain) const {
    if (!extend_domain && !domain_.contains(x)) {
        throw std::domain_error("alpha = " + vdc::toString(x) +
                                " lies outside the bound's domain");
    }
    // Horner
    Rational result = 0;
    for (auto it = coefficients_.rbegin(); it != coefficients_.rend(); ++it) {
        result = result * x + *it;
    }
    return result;
}

bool BetaBound::dominates(const BetaBound& other) const {
    if (!domain_.covers(other.domain_)) return false;

    // other - this
    const size_t n = std::max(coefficients_.size(), other.coefficients_.size());
    std::vector<Rational> diff(n, Rational(0));
    for (size_t i = 0; i < other.coefficients_.size(); i++) diff[i] += other.coefficients_[i];
    for (size_t i = 0; i < coefficients_.size(); i++) diff[i] -= coefficients_[i];

    // Substitute α = x0 + (x1 - x0)·t, t ∈ [0, 1]
    const size_t d = n - 1;
    const Rational& a = other.domain_.x0;
    for (size_t i = 0; i < d; i++) {
        for (size_t j = d; j-- > i;) {
            diff[j] += a * diff[j + 1];
        }
    }
    const Rational h = other.domain_.x1 - a;
    Rational scale(1);
    for (size_t k = 1; k <= d; k++) {
        scale *= h;
        diff[k] *= scale;
    }

    // A polynomial whose Bernstein coefficients are all non-negative is
    // non-negative on [0, 1]
    for (size_t i = 0; i <= d; i++) {
        Rational b(0);
        for (size_t k = 0; k <= i; k++) {
            b += binomial(i, k) / binomial(d, k) * diff[k];
        }
        if (b < 0) return false;
    }
    return true;
}

std::string BetaBound::toString() const {
    std::string poly;
    for (size_t i = 0; i < coefficients_.size(); i++) {
        if (coefficients_[i] == 0 && coefficients_.size() > 1) continue;
        if (!poly.empty()) poly += " + ";
        poly += vdc::toString(coefficients_[i]);
        if (i == 1) poly += "α";
        else if (i > 1) poly += "α^" + std::to_string(i);
    }
    if (poly.empty()) poly = "0";
    return "β(α) ≤ " + poly + " for α ∈ " +
           (domain_.include_lower ? "[" : "(") + vdc::toString(domain_.x0) + ", " +
           vdc::toString(domain_.x1) + (domain_.include_upper ? "]" : ")");
}

} // namespace vdc
