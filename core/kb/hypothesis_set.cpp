#include "kb/hypothesis_set.hpp"

#include <stdexcept>

namespace vdc {

HypothesisSet::HypothesisSet(const std::vector<HypothesisPtr>& hypotheses) {
    addHypotheses(hypotheses);
}

bool HypothesisSet::add(const HypothesisPtr& h) {
    if (!h) {
        throw std::invalid_argument("Cannot add a null hypothesis");
    }
    if (!members_.insert(h.get()).second) return false;
    hypotheses_.push_back(h);
    data_valid_ = false;
    return true;
}

size_t HypothesisSet::addHypotheses(const std::vector<HypothesisPtr>& hypotheses) {
    size_t added = 0;
    for (const auto& h : hypotheses) {
        if (add(h)) added++;
    }
    return added;
}

std::vector<HypothesisPtr> HypothesisSet::listHypotheses(HypothesisType type) const {
    std::vector<HypothesisPtr> result;
    for (const auto& h : hypotheses_) {
        if (h->type() == type) result.push_back(h);
    }
    return result;
}

std::optional<HypothesisPtr> HypothesisSet::findHypothesis(const std::string& keyword) const {
    for (const auto& h : hypotheses_) {
        if (h->matchesKeyword(keyword)) return h;
    }
    return std::nullopt;
}

const std::vector<HypothesisPtr>* HypothesisSet::cachedConvexHull() const {
    return data_valid_ ? &convex_hull_ : nullptr;
}

void HypothesisSet::storeConvexHull(std::vector<HypothesisPtr> vertices) {
    convex_hull_ = std::move(vertices);
    data_valid_ = true;
}

} // namespace vdc
