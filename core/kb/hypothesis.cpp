#include "kb/hypothesis.hpp"
#include "transforms/transform_base.hpp"

#include <algorithm>
#include <stdexcept>

namespace vdc {

std::string toString(HypothesisType type) {
    switch (type) {
        case HypothesisType::ExponentPair:          return "Exponent pair";
        case HypothesisType::ExponentPairTransform: return "Exponent pair transform";
        case HypothesisType::BetaBound:             return "Upper bound on beta";
    }
    return "Unknown";
}

Hypothesis::Hypothesis(std::string name, HypothesisType type, Payload data,
                       std::string proof, Reference reference,
                       std::vector<HypothesisPtr> dependencies)
    : name_(std::move(name)), type_(type), data_(std::move(data)),
      proof_(std::move(proof)), reference_(std::move(reference)) {

    bool consistent =
        (type_ == HypothesisType::ExponentPair && std::holds_alternative<ExponentPair>(data_)) ||
        (type_ == HypothesisType::ExponentPairTransform && std::holds_alternative<TransformPtr>(data_)) ||
        (type_ == HypothesisType::BetaBound && std::holds_alternative<BetaBound>(data_));
    if (!consistent) {
        throw std::invalid_argument("Payload does not match hypothesis type '" +
                                    toString(type_) + "' for " + name_);
    }
    if (type_ == HypothesisType::ExponentPairTransform && !std::get<TransformPtr>(data_)) {
        throw std::invalid_argument("Null transform in " + name_);
    }

    // Dependencies form a set; keep first occurrence order.
    for (auto& d : dependencies) {
        if (!d) throw std::invalid_argument("Null dependency in " + name_);
        if (std::find(dependencies_.begin(), dependencies_.end(), d) == dependencies_.end()) {
            dependencies_.push_back(std::move(d));
        }
    }
}

const ExponentPair& Hypothesis::exponentPair() const {
    if (auto p = std::get_if<ExponentPair>(&data_)) return *p;
    throw std::invalid_argument(name_ + " is not an exponent pair");
}

const PairTransform& Hypothesis::transform() const {
    if (auto p = std::get_if<TransformPtr>(&data_)) return **p;
    throw std::invalid_argument(name_ + " is not an exponent pair transform");
}

const BetaBound& Hypothesis::betaBound() const {
    if (auto p = std::get_if<BetaBound>(&data_)) return *p;
    throw std::invalid_argument(name_ + " is not a bound on beta");
}

double Hypothesis::proofComplexity() const {
    if (dependencies_.empty()) return 1.0;
    double total = 1.0;
    for (const auto& d : dependencies_) {
        total += d->proofComplexity();
    }
    return total;
}

bool Hypothesis::matchesKeyword(const std::string& keyword) const {
    return name_.find(keyword) != std::string::npos;
}

std::optional<int> maxYear(const std::vector<HypothesisPtr>& hypotheses) {
    std::vector<Reference> refs;
    refs.reserve(hypotheses.size());
    for (const auto& h : hypotheses) {
        refs.push_back(h->reference());
    }
    return Reference::maxYear(refs);
}

} // namespace vdc
