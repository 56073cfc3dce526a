#pragma once

namespace vdc {

/// Precision used whenever an exact rational is rendered as a decimal.
/// Chosen once at engine construction and passed around read-only.
struct NumericConfig {
    unsigned decimal_digits = 1000;
};

} // namespace vdc
