#pragma once

#include "kb/hypothesis_set.hpp"
#include "search/search_config.hpp"

#include <optional>
#include <string>

namespace vdc {

/// How findBestProof chooses among valid proofs.
enum class ProofOptimization {
    Date,        // historically earliest proof
    Complexity,  // least complex containing triangle
    None,        // no optimisation; not supported
};

enum class ProofStatus {
    Proved,
    NoResult,
    NotSupported,
};

/// Outcome of findBestProof. `proof` is set only when status is Proved.
struct ProofResult {
    ProofStatus status = ProofStatus::NoResult;
    HypothesisPtr proof;

    bool proved() const { return status == ProofStatus::Proved; }
};

std::string toString(ProofOptimization method);
std::string toString(ProofStatus status);

/// Try to prove that (k, l) is an exponent pair from `hypotheses`.
///
/// Works on a shallow copy, augmented with the pairs implied by β-bounds and
/// by the closure under the registered transforms. Returns nullopt when no
/// exponent pair is known or (k, l) lies outside their convex hull.
///
/// With `optimize`, the proof cites the three hull vertices of least total
/// proof complexity whose triangle contains (k, l); ties go to the first
/// triangle in lexicographic index order. Otherwise it cites every hull vertex.
std::optional<HypothesisPtr> findProof(const Rational& k, const Rational& l,
                                       const HypothesisSet& hypotheses,
                                       bool optimize = true,
                                       const EngineConfig& config = EngineConfig{});

/// Try to prove (k, l) using the given optimisation strategy.
/// Throws std::logic_error for an unrecognised strategy.
ProofResult findBestProof(const Rational& k, const Rational& l,
                          const HypothesisSet& hypotheses,
                          ProofOptimization method = ProofOptimization::Date,
                          const EngineConfig& config = EngineConfig{});

} // namespace vdc
