#include "transforms/transform_base.hpp"
#include "pairs/pair_hypotheses.hpp"

#include <stdexcept>

namespace vdc {

HypothesisPtr transformHypothesis(TransformPtr transform, const Reference& ref,
                                  const std::string& proof) {
    if (!transform) {
        throw std::invalid_argument("transformHypothesis: null transform");
    }
    std::string name = transform->name();
    std::string narrative = proof.empty()
        ? "See [" + ref.author() + ", " + ref.yearString() + "]"
        : proof;
    return std::make_shared<const Hypothesis>(
        name, HypothesisType::ExponentPairTransform, std::move(transform), narrative, ref);
}

HypothesisPtr applyTransform(const HypothesisPtr& transform_h, const HypothesisPtr& pair_h) {
    if (!transform_h || transform_h->type() != HypothesisType::ExponentPairTransform) {
        throw std::invalid_argument("applyTransform: first argument must be an exponent pair transform");
    }
    if (!pair_h || pair_h->type() != HypothesisType::ExponentPair) {
        throw std::invalid_argument("applyTransform: second argument must be an exponent pair");
    }

    const PairTransform& t = transform_h->transform();
    ExponentPair image = t.map(pair_h->exponentPair());
    return derivedExpPair(image.k, image.l,
        "Follows from applying the " + t.name() + " to " + pair_h->exponentPair().toString(),
        {pair_h, transform_h});
}

} // namespace vdc
