#include "pairs/exponent_pair.hpp"

namespace vdc {

std::string ExponentPair::toString() const {
    return "(" + vdc::toString(k) + ", " + vdc::toString(l) + ")";
}

} // namespace vdc
