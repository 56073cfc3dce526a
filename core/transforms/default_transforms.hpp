#pragma once

#include "kb/hypothesis_set.hpp"

namespace vdc {

/// Insert the van der Corput A and B transforms into `set`.
void registerDefaultTransforms(HypothesisSet& set);

} // namespace vdc
