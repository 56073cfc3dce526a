#include "bounds/bound_hypotheses.hpp"

#include "util/debug_log.hpp"

#include <algorithm>

namespace vdc {

HypothesisPtr literatureBetaBound(const BetaBound& bound, const Reference& ref) {
    return std::make_shared<const Hypothesis>(
        ref.author() + " bound on beta", HypothesisType::BetaBound, bound,
        "See [" + ref.author() + ", " + ref.yearString() + "]", ref);
}

HypothesisPtr derivedBetaBound(const BetaBound& bound, const std::string& proof,
                               const std::vector<HypothesisPtr>& dependencies) {
    return std::make_shared<const Hypothesis>(
        "Derived " + bound.toString(), HypothesisType::BetaBound, bound, proof,
        Reference::derived(maxYear(dependencies)), dependencies);
}

std::vector<HypothesisPtr> bestBetaBounds(const HypothesisSet& set) {
    const auto all = set.listHypotheses(HypothesisType::BetaBound);

    std::vector<HypothesisPtr> bounds;
    for (size_t i = 0; i < all.size(); i++) {
        const BetaBound& piece = all[i]->betaBound();
        bool dominated = false;
        for (size_t j = 0; j < all.size() && !dominated; j++) {
            if (j == i) continue;
            const BetaBound& rival = all[j]->betaBound();
            dominated = rival.dominates(piece) && (j < i || !piece.dominates(rival));
        }
        if (dominated) {
            VDC_DEBUG_LOG("dropping dominated bound: %s", piece.toString().c_str());
            continue;
        }
        bounds.push_back(all[i]);
    }

    std::stable_sort(bounds.begin(), bounds.end(),
        [](const HypothesisPtr& a, const HypothesisPtr& b) {
            const Interval& da = a->betaBound().domain();
            const Interval& db = b->betaBound().domain();
            if (da.x0 != db.x0) return da.x0 < db.x0;
            return da.x1 < db.x1;
        });
    return bounds;
}

} // namespace vdc
