#include "duality/beta_duality.hpp"
#include "bounds/bound_hypotheses.hpp"
#include "geometry/convex_hull.hpp"
#include "pairs/pair_hypotheses.hpp"
#include "transforms/transform_base.hpp"
#include "util/debug_log.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace vdc {

namespace {

constexpr const char* kBTransformKeyword = "van der Corput B transform";

// Number of leading anchor points in the point list.
constexpr size_t kAnchorCount = 2;

bool touchesBoundary(const BetaBound& bound, const Point2& p) {
    const Interval& d = bound.domain();
    if (d.x0 != p.x && d.x1 != p.x) return false;
    return bound.at(p.x, true) == p.y;
}

} // namespace

std::vector<HypothesisPtr> betaBoundsToExponentPairs(const HypothesisSet& set) {
    const Rational half(1, 2);

    std::vector<HypothesisPtr> bounds = bestBetaBounds(set);
    if (bounds.empty()) return {};

    // Pieces are ordered by x0 only, so the right end needs a scan
    Rational right_end = bounds.front()->betaBound().domain().x1;
    for (const auto& h : bounds) {
        right_end = std::max(right_end, h->betaBound().domain().x1);
    }
    if (bounds.front()->betaBound().domain().x0 > 0 || right_end < half) {
        return {};
    }

    // Anchor points: the trivial (0, 0) and a placeholder at (1/2, 0)
    std::vector<Point2> points;
    points.emplace_back(Rational(0), Rational(0));
    points.emplace_back(half, Rational(0));
    for (const auto& h : bounds) {
        const BetaBound& piece = h->betaBound();
        const Interval& d = piece.domain();
        points.emplace_back(d.x0, piece.at(d.x0, true));
        points.emplace_back(d.x1, piece.at(d.x1, true));
    }

    std::vector<size_t> hull = convexHullIndices(points);

    // Every piece on the hull boundary is cited by every derived pair.
    std::set<size_t> dep_indices;
    for (size_t v : hull) {
        if (v < kAnchorCount) continue;
        for (size_t i = 0; i < bounds.size(); i++) {
            if (touchesBoundary(bounds[i]->betaBound(), points[v])) {
                dep_indices.insert(i);
            }
        }
    }
    std::vector<HypothesisPtr> dependencies;
    for (size_t i : dep_indices) {
        dependencies.push_back(bounds[i]);
    }

    std::vector<HypothesisPtr> all_pairs = set.listHypotheses(HypothesisType::ExponentPair);
    std::map<PairKey, HypothesisPtr> known;
    for (const auto& h : all_pairs) {
        known.emplace(h->exponentPair().key(), h);
    }

    std::optional<HypothesisPtr> b_transform;
    for (const auto& t : set.listHypotheses(HypothesisType::ExponentPairTransform)) {
        if (t->matchesKeyword(kBTransformKeyword)) {
            b_transform = t;
            break;
        }
    }

    const std::string proof = "Follows from combining " +
        std::to_string(dependencies.size()) + " bounds on beta";

    const size_t n = hull.size();
    for (size_t i = 0; n >= 2 && i < n; i++) {
        const Point2& p1 = points[hull[i]];
        const Point2& p2 = points[hull[(i + 1) % n]];
        if ((p1.y == 0 && p2.y == 0) ||
            (p1.x == 0 && p2.x == 0) ||
            (p1.x == half && p2.x == half) ||
            p1.x == p2.x) {
            continue;
        }

        // Tangent line β = mα + c  ⇒  exponent pair (c, m + c)
        Rational m = (p2.y - p1.y) / (p2.x - p1.x);
        Rational c = (p1.y * p2.x - p1.x * p2.y) / (p2.x - p1.x);
        PairKey key(c, Rational(m + c));

        HypothesisPtr pair;
        auto it = known.find(key);
        if (it == known.end()) {
            pair = derivedExpPair(key.first, key.second, proof, dependencies);
            all_pairs.push_back(pair);
            known.emplace(key, pair);
            VDC_DEBUG_LOG("beta duality: new exponent pair %s",
                          pair->exponentPair().toString().c_str());
        } else {
            pair = it->second;
        }

        if (!b_transform) continue;
        HypothesisPtr mirror = applyTransform(*b_transform, pair);
        PairKey mirror_key = mirror->exponentPair().key();
        if (!known.count(mirror_key)) {
            all_pairs.push_back(mirror);
            known.emplace(std::move(mirror_key), mirror);
        }
    }

    return all_pairs;
}

} // namespace vdc
