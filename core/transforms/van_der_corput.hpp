#pragma once

#include "transforms/transform_base.hpp"

namespace vdc {

/// A : (k, l) → (k / (2k + 2), 1/2 + l / (2k + 2))
class VanDerCorputA : public PairTransform {
public:
    std::string name() const override;
    ExponentPair map(const ExponentPair& pair) const override;
};

/// B : (k, l) → (l - 1/2, k + 1/2). An involution.
class VanDerCorputB : public PairTransform {
public:
    std::string name() const override;
    ExponentPair map(const ExponentPair& pair) const override;
};

} // namespace vdc
