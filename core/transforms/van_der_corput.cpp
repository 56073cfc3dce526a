#include "transforms/van_der_corput.hpp"

#include <stdexcept>

namespace vdc {

// ─── A process ─────────────────────────────────────────────────

std::string VanDerCorputA::name() const { return "van der Corput A transform"; }

ExponentPair VanDerCorputA::map(const ExponentPair& pair) const {
    Rational denom = 2 * pair.k + 2;
    if (denom == 0) {
        throw std::domain_error("A transform undefined at k = -1");
    }
    Rational k = pair.k / denom;
    Rational l = Rational(1, 2) + pair.l / denom;
    k.canonicalize();
    l.canonicalize();
    return ExponentPair(k, l);
}

// ─── B process ─────────────────────────────────────────────────

std::string VanDerCorputB::name() const { return "van der Corput B transform"; }

ExponentPair VanDerCorputB::map(const ExponentPair& pair) const {
    Rational half(1, 2);
    return ExponentPair(Rational(pair.l - half), Rational(pair.k + half));
}

} // namespace vdc
