#pragma once

#include "numeric/rational.hpp"

#include <cstddef>
#include <vector>

namespace vdc {

struct Point2 {
    Rational x;
    Rational y;

    Point2() = default;
    Point2(Rational x, Rational y) : x(std::move(x)), y(std::move(y)) {}

    bool operator==(const Point2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point2& o) const { return !(*this == o); }
    bool operator<(const Point2& o) const { return x < o.x || (x == o.x && y < o.y); }
};

/// Twice the signed area of (o, a, b); positive for a counter-clockwise turn.
Rational cross(const Point2& o, const Point2& a, const Point2& b);

/// Indices into `points` of the convex hull vertices, counter-clockwise,
/// starting from the lexicographically smallest point. Collinear boundary
/// points are not vertices. Of several equal points the first index is kept.
/// Fewer than three distinct points give the distinct points themselves;
/// a collinear input gives its two extreme points.
std::vector<size_t> convexHullIndices(const std::vector<Point2>& points);

// ─── Polytope ──────────────────────────────────────────────────
// Convex polygon in V-representation with exact containment.

class Polytope {
public:
    /// Build from any point list; the hull is taken internally.
    static Polytope fromVertices(const std::vector<Point2>& points);

    /// Boundary-inclusive. Degenerate polytopes (a point or a segment)
    /// contain exactly their own points.
    bool contains(const Point2& p) const;

    /// Counter-clockwise hull vertices.
    const std::vector<Point2>& vertices() const { return vertices_; }

    size_t size() const { return vertices_.size(); }

private:
    std::vector<Point2> vertices_;
};

} // namespace vdc
