#pragma once

#include "kb/hypothesis.hpp"
#include "pairs/exponent_pair.hpp"

#include <memory>
#include <string>

namespace vdc {

/// Base class for all exponent pair transforms.
/// T : (k, l) → (k', l')
/// Must be pure and deterministic: equal inputs give equal outputs.
class PairTransform {
public:
    virtual ~PairTransform() = default;

    /// Unique label, e.g. "van der Corput A transform".
    virtual std::string name() const = 0;

    /// Apply the transform once to the underlying pair.
    virtual ExponentPair map(const ExponentPair& pair) const = 0;
};

/// Wrap a transform as an ExponentPairTransform hypothesis named after it.
HypothesisPtr transformHypothesis(TransformPtr transform, const Reference& ref,
                                  const std::string& proof = "");

/// Apply `transform_h` to `pair_h`, producing a derived exponent pair that
/// cites both. Throws std::invalid_argument if either has the wrong type.
HypothesisPtr applyTransform(const HypothesisPtr& transform_h, const HypothesisPtr& pair_h);

} // namespace vdc
