#pragma once

#include "bounds/beta_bound.hpp"
#include "kb/reference.hpp"
#include "pairs/exponent_pair.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace vdc {

class PairTransform;
class Hypothesis;

using HypothesisPtr = std::shared_ptr<const Hypothesis>;
using TransformPtr = std::shared_ptr<const PairTransform>;

enum class HypothesisType {
    ExponentPair,
    ExponentPairTransform,
    BetaBound,
};

std::string toString(HypothesisType type);

// ─── Hypothesis ────────────────────────────────────────────────
// An immutable, citable statement: a payload plus provenance (proof
// narrative, reference, and the hypotheses it was derived from).
// Shared by pointer; never modified after construction.

class Hypothesis {
public:
    using Payload = std::variant<ExponentPair, TransformPtr, BetaBound>;

    Hypothesis(std::string name, HypothesisType type, Payload data,
               std::string proof, Reference reference,
               std::vector<HypothesisPtr> dependencies = {});

    const std::string& name() const { return name_; }
    HypothesisType type() const { return type_; }
    const Payload& data() const { return data_; }
    const std::string& proof() const { return proof_; }
    const Reference& reference() const { return reference_; }
    const std::vector<HypothesisPtr>& dependencies() const { return dependencies_; }

    /// Typed payload access. Throws std::invalid_argument on a type mismatch.
    const ExponentPair& exponentPair() const;
    const PairTransform& transform() const;
    const BetaBound& betaBound() const;

    /// 1 for a leaf, otherwise 1 + the sum over dependencies.
    double proofComplexity() const;

    /// True when `keyword` occurs in the name.
    bool matchesKeyword(const std::string& keyword) const;

private:
    std::string name_;
    HypothesisType type_;
    Payload data_;
    std::string proof_;
    Reference reference_;
    std::vector<HypothesisPtr> dependencies_;
};

/// Latest known year among the references of `hypotheses`.
std::optional<int> maxYear(const std::vector<HypothesisPtr>& hypotheses);

} // namespace vdc
