#include <gtest/gtest.h>
#include "geometry/convex_hull.hpp"

#include <algorithm>

using namespace vdc;

namespace {
Point2 pt(const char* x, const char* y) { return Point2(parseRational(x), parseRational(y)); }
}

// ─── Hull construction ────────────────────────────────────────

TEST(GeometryTest, SquareWithInteriorPoint) {
    std::vector<Point2> pts = {pt("0", "0"), pt("1", "0"), pt("1", "1"), pt("0", "1"), pt("1/2", "1/2")};
    std::vector<size_t> hull = convexHullIndices(pts);
    std::vector<size_t> expected = {0, 1, 2, 3};
    EXPECT_EQ(hull, expected);
}

TEST(GeometryTest, CollinearBoundaryPointIsNotVertex) {
    std::vector<Point2> pts = {pt("0", "0"), pt("1/2", "0"), pt("1", "0"), pt("0", "1")};
    std::vector<size_t> hull = convexHullIndices(pts);
    EXPECT_EQ(hull.size(), 3u);
    EXPECT_EQ(std::count(hull.begin(), hull.end(), 1u), 0);
}

TEST(GeometryTest, DuplicatesKeepFirstIndex) {
    std::vector<Point2> pts = {pt("0", "0"), pt("0", "0"), pt("1", "0")};
    std::vector<size_t> hull = convexHullIndices(pts);
    std::vector<size_t> expected = {0, 2};
    EXPECT_EQ(hull, expected);
}

TEST(GeometryTest, CollinearInputGivesEndpoints) {
    std::vector<Point2> pts = {pt("1", "1"), pt("0", "0"), pt("2", "2")};
    std::vector<size_t> hull = convexHullIndices(pts);
    std::vector<size_t> expected = {1, 2};
    EXPECT_EQ(hull, expected);
}

TEST(GeometryTest, CounterClockwiseOrder) {
    std::vector<Point2> pts = {pt("0", "1"), pt("1/6", "2/3"), pt("1/2", "1/2")};
    std::vector<size_t> hull = convexHullIndices(pts);
    ASSERT_EQ(hull.size(), 3u);
    EXPECT_GT(cross(pts[hull[0]], pts[hull[1]], pts[hull[2]]), 0);
}

// ─── Containment ──────────────────────────────────────────────

TEST(GeometryTest, ContainsIsBoundaryInclusive) {
    Polytope square = Polytope::fromVertices(
        {pt("0", "0"), pt("1", "0"), pt("1", "1"), pt("0", "1")});
    EXPECT_TRUE(square.contains(pt("1/2", "1/2")));
    EXPECT_TRUE(square.contains(pt("1", "1/2")));
    EXPECT_TRUE(square.contains(pt("0", "0")));
    EXPECT_FALSE(square.contains(pt("2", "0")));
    EXPECT_FALSE(square.contains(pt("1/2", "-1/1000000")));
}

TEST(GeometryTest, DegeneratePolytopes) {
    Polytope empty = Polytope::fromVertices({});
    EXPECT_FALSE(empty.contains(pt("0", "0")));

    Polytope point = Polytope::fromVertices({pt("0", "1")});
    EXPECT_TRUE(point.contains(pt("0", "1")));
    EXPECT_FALSE(point.contains(pt("1/2", "1/2")));

    Polytope segment = Polytope::fromVertices({pt("0", "1"), pt("1/2", "1/2")});
    EXPECT_TRUE(segment.contains(pt("1/4", "3/4")));
    EXPECT_FALSE(segment.contains(pt("1/4", "1/2")));
    EXPECT_FALSE(segment.contains(pt("1", "0")));
}
