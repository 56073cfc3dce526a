#include "pairs/pair_hypotheses.hpp"

namespace vdc {

HypothesisPtr literatureExpPair(const Rational& k, const Rational& l, const Reference& ref) {
    return std::make_shared<const Hypothesis>(
        ref.author() + " exponent pair", HypothesisType::ExponentPair,
        ExponentPair(k, l),
        "See [" + ref.author() + ", " + ref.yearString() + "]", ref);
}

HypothesisPtr derivedExpPair(const Rational& k, const Rational& l, const std::string& proof,
                             const std::vector<HypothesisPtr>& dependencies) {
    ExponentPair pair(k, l);
    return std::make_shared<const Hypothesis>(
        "Derived exponent pair " + pair.toString(), HypothesisType::ExponentPair,
        pair, proof, Reference::derived(maxYear(dependencies)), dependencies);
}

HypothesisPtr trivialExpPair() {
    return std::make_shared<const Hypothesis>(
        "Trivial exponent pair (0, 1)", HypothesisType::ExponentPair,
        ExponentPair(Rational(0), Rational(1)), "Triangle inequality", Reference::trivial());
}

HypothesisPtr exponentPairConjecture() {
    return std::make_shared<const Hypothesis>(
        "Exponent pair conjecture", HypothesisType::ExponentPair,
        ExponentPair(Rational(0), Rational(0)), "Conjecture", Reference::conjectured());
}

} // namespace vdc
