#include "geometry/convex_hull.hpp"

#include <algorithm>
#include <numeric>

namespace vdc {

Rational cross(const Point2& o, const Point2& a, const Point2& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

std::vector<size_t> convexHullIndices(const std::vector<Point2>& points) {
    std::vector<size_t> order(points.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&](size_t a, size_t b) { return points[a] < points[b]; });
    order.erase(std::unique(order.begin(), order.end(),
        [&](size_t a, size_t b) { return points[a] == points[b]; }), order.end());

    if (order.size() < 3) return order;

    // Andrew's monotone chain; pop on non-left turns so collinear points drop out
    std::vector<size_t> hull(2 * order.size());
    size_t k = 0;
    for (size_t i : order) {
        while (k >= 2 && cross(points[hull[k - 2]], points[hull[k - 1]], points[i]) <= 0) k--;
        hull[k++] = i;
    }
    for (size_t j = order.size() - 1, lower = k + 1; j-- > 0;) {
        size_t i = order[j];
        while (k >= lower && cross(points[hull[k - 2]], points[hull[k - 1]], points[i]) <= 0) k--;
        hull[k++] = i;
    }
    hull.resize(k - 1);  // last point repeats the first
    return hull;
}

Polytope Polytope::fromVertices(const std::vector<Point2>& points) {
    Polytope poly;
    for (size_t i : convexHullIndices(points)) {
        poly.vertices_.push_back(points[i]);
    }
    return poly;
}

bool Polytope::contains(const Point2& p) const {
    const size_t n = vertices_.size();
    if (n == 0) return false;
    if (n == 1) return vertices_[0] == p;
    if (n == 2) {
        const Point2& a = vertices_[0];
        const Point2& b = vertices_[1];
        if (cross(a, b, p) != 0) return false;
        return std::min(a.x, b.x) <= p.x && p.x <= std::max(a.x, b.x) &&
               std::min(a.y, b.y) <= p.y && p.y <= std::max(a.y, b.y);
    }
    for (size_t i = 0; i < n; i++) {
        if (cross(vertices_[i], vertices_[(i + 1) % n], p) < 0) return false;
    }
    return true;
}

} // namespace vdc
