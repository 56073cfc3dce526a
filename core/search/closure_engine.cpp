#include "search/closure_engine.hpp"
#include "geometry/convex_hull.hpp"
#include "transforms/transform_base.hpp"
#include "util/debug_log.hpp"

#include <map>
#include <stdexcept>

namespace vdc {

namespace {

// Insertion-ordered map from (k, l) to the first hypothesis with that key.
class PairTable {
public:
    bool insert(const HypothesisPtr& h) {
        PairKey key = h->exponentPair().key();
        if (index_.count(key)) return false;
        index_.emplace(std::move(key), pairs_.size());
        pairs_.push_back(h);
        return true;
    }

    const std::vector<HypothesisPtr>& pairs() const { return pairs_; }
    size_t size() const { return pairs_.size(); }

    void clear() {
        pairs_.clear();
        index_.clear();
    }

private:
    std::vector<HypothesisPtr> pairs_;
    std::map<PairKey, size_t> index_;
};

void pruneToHull(PairTable& table) {
    std::vector<HypothesisPtr> current = table.pairs();
    std::vector<Point2> points;
    points.reserve(current.size());
    for (const auto& h : current) {
        const ExponentPair& p = h->exponentPair();
        points.emplace_back(p.k, p.l);
    }
    table.clear();
    for (size_t i : convexHullIndices(points)) {
        table.insert(current[i]);
    }
}

} // namespace

std::vector<HypothesisPtr> computeExpPairs(const HypothesisSet& set,
                                           const ClosureConfig& config) {
    if (config.search_depth < 0) {
        throw std::invalid_argument("search_depth must be non-negative");
    }

    const auto transforms = set.listHypotheses(HypothesisType::ExponentPairTransform);

    PairTable table;
    for (const auto& h : set.listHypotheses(HypothesisType::ExponentPair)) {
        table.insert(h);
    }

    for (int round = 0; round < config.search_depth; round++) {
        for (const auto& t : transforms) {
            // Snapshot per transform, not per round
            const std::vector<HypothesisPtr> snapshot = table.pairs();
            for (const auto& p : snapshot) {
                HypothesisPtr image = applyTransform(t, p);
                table.insert(image);
            }
        }

        size_t before = table.size();
        if (config.prune && table.size() >= 3) {
            pruneToHull(table);
        }
        VDC_DEBUG_LOG("closure round %d: %zu pairs, %zu after pruning",
                      round + 1, before, table.size());
        (void)before;
    }

    return table.pairs();
}

} // namespace vdc
