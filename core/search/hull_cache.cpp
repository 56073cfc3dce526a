#include "search/hull_cache.hpp"
#include "geometry/convex_hull.hpp"
#include "util/debug_log.hpp"

namespace vdc {

const std::vector<HypothesisPtr>& computeConvexHull(HypothesisSet& set) {
    if (const auto* cached = set.cachedConvexHull()) {
        return *cached;
    }

    auto pairs = set.listHypotheses(HypothesisType::ExponentPair);
    if (pairs.size() < 3) {
        // Too few for a hull; equal keys still count once
        std::vector<HypothesisPtr> distinct;
        for (const auto& h : pairs) {
            if (distinct.empty() || distinct.front()->exponentPair() != h->exponentPair()) {
                distinct.push_back(h);
            }
        }
        set.storeConvexHull(std::move(distinct));
    } else {
        std::vector<Point2> points;
        points.reserve(pairs.size());
        for (const auto& h : pairs) {
            points.emplace_back(h->exponentPair().k, h->exponentPair().l);
        }
        std::vector<HypothesisPtr> vertices;
        for (size_t i : convexHullIndices(points)) {
            vertices.push_back(pairs[i]);
        }
        VDC_DEBUG_LOG("convex hull: %zu of %zu pairs are vertices",
                      vertices.size(), pairs.size());
        set.storeConvexHull(std::move(vertices));
    }
    return *set.cachedConvexHull();
}

} // namespace vdc
