#include "transforms/default_transforms.hpp"
#include "transforms/van_der_corput.hpp"

namespace vdc {

void registerDefaultTransforms(HypothesisSet& set) {
    set.add(transformHypothesis(std::make_shared<VanDerCorputA>(),
                                Reference::literature("van der Corput", 1920)));
    set.add(transformHypothesis(std::make_shared<VanDerCorputB>(),
                                Reference::literature("van der Corput", 1920)));
}

} // namespace vdc
