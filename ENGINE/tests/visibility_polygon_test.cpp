#include "../spatial_index.hpp"
#include "../visibility_polygon.hpp"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>

using namespace visibility;

namespace {

constexpr double pi = 3.14159265358979323846;

double dist(const Point& a, const Point& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

// A few walls and a pillar around the origin.
std::vector<Segment> room() {
    return {
        { 2, -1, 2, 1 },
        { -3, -2, -1, -3 },
        { -1, 2.5, 1.5, 2.5 },
        { 3.5, 3, 4.5, 3 }, { 4.5, 3, 4.5, 4 }, { 4.5, 4, 3.5, 4 }, { 3.5, 4, 3.5, 3 },
        { -6, -0.5, -6, 0.5 },
    };
}

} // namespace

TEST(VisibilityAnglesTest, BaseRaysAreEvenlySpaced) {
    const auto a = base_ray_angles(4);
    ASSERT_EQ(a.size(), 4u);
    EXPECT_DOUBLE_EQ(a[0], 0.0);
    EXPECT_DOUBLE_EQ(a[1], pi / 2);
    EXPECT_DOUBLE_EQ(a[3], 3 * pi / 2);
    EXPECT_TRUE(base_ray_angles(0).empty());
}

TEST(VisibilityAnglesTest, EdgesAreFlaggedOnBothSidesOfAJump) {
    const auto edges = detect_edge_rays({ 5, 5, 1, 5 }, 5.0);
    ASSERT_EQ(edges.size(), 3u);
    EXPECT_DOUBLE_EQ(edges[0], pi / 2);
    EXPECT_DOUBLE_EQ(edges[1], pi);
    EXPECT_DOUBLE_EQ(edges[2], 3 * pi / 2);

    EXPECT_TRUE(detect_edge_rays({ 5, 4.9, 5, 4.8 }, 5.0).empty());
}

TEST(VisibilityAnglesTest, RefinementSplitsBudgetAcrossEdges) {
    const auto one = refinement_angles({ 0.0 }, 4, 8);
    ASSERT_EQ(one.size(), 8u);
    for (double a : one) EXPECT_LT(std::fabs(a), pi / 2);

    // At least one ray pair per edge even when the budget is spent.
    EXPECT_EQ(refinement_angles({ 0.0, 1.0, 2.0 }, 4, 4).size(), 6u);
    EXPECT_TRUE(refinement_angles({}, 4, 8).empty());
}

TEST(VisibilityAnglesTest, VertexAnglesSkipEndpointsOutOfReach) {
    const auto a = vertex_angles({ 0, 0 }, 5.0, { { 2, 0, 9, 0 } });
    ASSERT_EQ(a.size(), 3u);
    EXPECT_DOUBLE_EQ(a[0], 0.0);
    EXPECT_DOUBLE_EQ(a[1], -vertex_angle_offset);
    EXPECT_DOUBLE_EQ(a[2], vertex_angle_offset);
}

TEST(VisibilityAnglesTest, MergeNormalizesSortsAndPins) {
    const auto merged = merge_angles({ 0.0, pi }, { -0.5 }, { pi, 2 * pi - 1e-12 });
    ASSERT_EQ(merged.size(), 3u);

    EXPECT_DOUBLE_EQ(merged[0].angle, 0.0);
    EXPECT_TRUE(merged[0].pinned);       // folded across the wrap
    EXPECT_DOUBLE_EQ(merged[1].angle, pi);
    EXPECT_TRUE(merged[1].pinned);
    EXPECT_NEAR(merged[2].angle, 2 * pi - 0.5, 1e-12);
    EXPECT_FALSE(merged[2].pinned);

    for (std::size_t i = 1; i < merged.size(); ++i) {
        EXPECT_LT(merged[i - 1].angle, merged[i].angle);
    }
}

TEST(VisibilityAnglesTest, DownsampleKeepsPinnedAngles) {
    std::vector<CandidateAngle> c;
    for (int i = 0; i < 20; ++i) c.push_back({ i * 0.1, i == 7 || i == 13 });

    const auto out = downsample_angles(c, 6);
    EXPECT_LE(out.size(), 6u);
    EXPECT_NE(std::find(out.begin(), out.end(), c[7].angle), out.end());
    EXPECT_NE(std::find(out.begin(), out.end(), c[13].angle), out.end());
    EXPECT_TRUE(std::is_sorted(out.begin(), out.end()));

    EXPECT_EQ(downsample_angles(c, 50).size(), 20u);
}

TEST(VisibilityAnglesTest, DownsampleStridesEverythingWhenPinnedOverflow) {
    std::vector<CandidateAngle> c;
    for (int i = 0; i < 10; ++i) c.push_back({ i * 0.1, true });
    EXPECT_EQ(downsample_angles(c, 4).size(), 4u);
}

TEST(VisibilityPolygonTest, NoOccludersGivesCircle) {
    const Point o{ 3.5, -2.5 };
    const auto poly = compute_visibility_polygon(o, 4.0, std::vector<Segment>{}, 540, 1080);
    ASSERT_EQ(poly.size(), 32u);
    for (const Point& p : poly) EXPECT_NEAR(dist(p, o), 4.0, 1e-12);
}

TEST(VisibilityPolygonTest, CornersOfNearbyWallAreExact) {
    const Point o{ 0, 0 };
    const std::vector<Segment> wall{ { 2, -1, 2, 1 } };
    const auto poly = compute_visibility_polygon(o, 5.0, wall, 72, 360);

    auto has_point = [&](const Point& target) {
        return std::any_of(poly.begin(), poly.end(),
                           [&](const Point& p) { return dist(p, target) < 1e-9; });
    };
    EXPECT_TRUE(has_point({ 2, 1 }));
    EXPECT_TRUE(has_point({ 2, -1 }));

    // Just past each corner the light reaches full radius.
    const double corner = std::atan2(1.0, 2.0);
    const Point past_top{ 5 * std::cos(corner + vertex_angle_offset), 5 * std::sin(corner + vertex_angle_offset) };
    const Point past_bottom{ 5 * std::cos(corner + vertex_angle_offset), -5 * std::sin(corner + vertex_angle_offset) };
    EXPECT_TRUE(has_point(past_top));
    EXPECT_TRUE(has_point(past_bottom));

    // Everything between the corners stops on the wall.
    for (const Point& p : poly) {
        const double a = std::atan2(p.y, p.x);
        if (std::fabs(a) < corner - 1e-9) EXPECT_NEAR(p.x, 2.0, 1e-9);
        EXPECT_LE(dist(p, o), 5.0 + 1e-12);
    }
    EXPECT_LE(poly.size(), 360u);
}

TEST(VisibilityPolygonTest, VerticesAreOrderedByAngle) {
    const auto poly = compute_visibility_polygon({ 0.25, 0.25 }, 6.0, room(), 72, 180);
    std::vector<double> angles;
    for (const Point& p : poly) {
        double a = std::atan2(p.y - 0.25, p.x - 0.25);
        if (a < 0) a += 2 * pi;
        angles.push_back(a);
    }
    // Allow the first vertex to sit just below 2pi after the atan2 round trip.
    EXPECT_TRUE(std::is_sorted(angles.begin() + 1, angles.end()));
}

TEST(VisibilityPolygonTest, SameInputSameOutput) {
    const auto a = compute_visibility_polygon({ 0.5, 0.5 }, 6.0, room(), 540, 1080);
    const auto b = compute_visibility_polygon({ 0.5, 0.5 }, 6.0, room(), 540, 1080);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].x, b[i].x);
        EXPECT_EQ(a[i].y, b[i].y);
    }
}

TEST(VisibilityPolygonTest, SpatialIndexPathMatchesBruteForce) {
    const std::vector<Segment> segs = room();
    for (double bucket : { 0.5, 2.0, 5.0 }) {
        const SpatialIndex index(segs, bucket);
        for (const Point& o : { Point{ 0.5, 0.5 }, Point{ -2.0, 1.0 }, Point{ 3.0, 3.5 } }) {
            const auto brute = compute_visibility_polygon(o, 7.0, segs, 180, 360);
            const auto fast  = compute_visibility_polygon(o, 7.0, segs, 180, 360, &index);
            ASSERT_EQ(brute.size(), fast.size());
            for (std::size_t i = 0; i < brute.size(); ++i) {
                EXPECT_EQ(brute[i].x, fast[i].x);
                EXPECT_EQ(brute[i].y, fast[i].y);
            }
        }
    }
}

TEST(VisibilityPolygonTest, RayBudgetIsRespected) {
    const auto poly = compute_visibility_polygon({ 0.5, 0.5 }, 8.0, room(), 90, 120);
    EXPECT_LE(poly.size(), 120u);
    EXPECT_GE(poly.size(), 60u);
}
