#include "numeric/rational.hpp"

#include <cmath>
#include <stdexcept>

namespace vdc {

Rational parseRational(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty rational literal");
    }
    Rational q;
    if (q.set_str(text, 10) != 0) {
        throw std::invalid_argument("Malformed rational literal: " + text);
    }
    if (q.get_den() == 0) {
        throw std::invalid_argument("Zero denominator: " + text);
    }
    q.canonicalize();
    return q;
}

std::string toString(const Rational& q) {
    return q.get_str(10);
}

std::string toDecimalString(const Rational& q, const NumericConfig& config) {
    // log2(10) bits per digit, plus guard bits
    auto bits = static_cast<mp_bitcnt_t>(
        std::ceil(config.decimal_digits * 3.3219280948873623) + 64);
    mpf_class f(q, bits);

    mp_exp_t exponent = 0;
    std::string digits = f.get_str(exponent, 10, config.decimal_digits);
    if (digits.empty() || digits == "0") return "0";

    std::string sign;
    if (digits[0] == '-') {
        sign = "-";
        digits.erase(0, 1);
    }

    std::string out;
    if (exponent <= 0) {
        out = "0." + std::string(static_cast<size_t>(-exponent), '0') + digits;
    } else if (static_cast<size_t>(exponent) >= digits.size()) {
        out = digits + std::string(static_cast<size_t>(exponent) - digits.size(), '0');
    } else {
        out = digits.substr(0, static_cast<size_t>(exponent)) + "." +
              digits.substr(static_cast<size_t>(exponent));
    }
    return sign + out;
}

} // namespace vdc
