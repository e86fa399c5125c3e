// === File: visibility_polygon.cpp ===
#include "visibility_polygon.hpp"
#include "occluder_builder.hpp"
#include "ray_intersection.hpp"
#include "spatial_index.hpp"

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace visibility {

namespace {

constexpr double two_pi = 2.0 * M_PI;

double cast_one(const Point& origin, double angle, double radius,
                const std::vector<Segment>& segments, const SpatialIndex* index)
{
    if (index) return ray::cast(origin, angle, radius, segments, *index);
    return ray::cast(origin, angle, radius, segments);
}

} // namespace

double normalize_angle(double angle) {
    double a = std::fmod(angle, two_pi);
    if (a < 0.0) a += two_pi;
    if (a >= two_pi) a = 0.0;
    return a;
}

std::vector<double> base_ray_angles(int min_rays) {
    std::vector<double> angles;
    if (min_rays <= 0) return angles;
    angles.reserve(static_cast<std::size_t>(min_rays));
    const double step = two_pi / min_rays;
    for (int i = 0; i < min_rays; ++i) {
        angles.push_back(i * step);
    }
    return angles;
}

std::vector<double> detect_edge_rays(const std::vector<double>& distances, double radius) {
    std::vector<double> edges;
    const std::size_t n = distances.size();
    if (n == 0) return edges;

    const double threshold = radius * edge_distance_fraction;
    const double step = two_pi / static_cast<double>(n);

    for (std::size_t i = 0; i < n; ++i) {
        const double prev = distances[(i + n - 1) % n];
        const double next = distances[(i + 1) % n];
        const double cur  = distances[i];
        if (std::fabs(cur - prev) > threshold || std::fabs(cur - next) > threshold) {
            edges.push_back(static_cast<double>(i) * step);
        }
    }
    return edges;
}

std::vector<double> refinement_angles(const std::vector<double>& edge_angles,
                                      int min_rays,
                                      int max_rays)
{
    std::vector<double> angles;
    if (edge_angles.empty() || min_rays <= 0) return angles;

    const int budget = std::max(0, max_rays - min_rays);
    const int per_edge = std::max(1, budget / static_cast<int>(edge_angles.size()));
    const double step = two_pi / min_rays;

    angles.reserve(edge_angles.size() * static_cast<std::size_t>(per_edge) * 2);
    for (double edge : edge_angles) {
        for (int j = 1; j <= per_edge; ++j) {
            const double offset = (static_cast<double>(j) / (per_edge + 1)) * step;
            angles.push_back(edge - offset);
            angles.push_back(edge + offset);
        }
    }
    return angles;
}

std::vector<double> vertex_angles(const Point& origin,
                                  double radius,
                                  const std::vector<Segment>& segments)
{
    std::vector<double> angles;
    angles.reserve(segments.size() * 6);

    auto add_endpoint = [&](double x, double y) {
        const double dx = x - origin.x;
        const double dy = y - origin.y;
        if (std::hypot(dx, dy) > radius) return;
        const double a = std::atan2(dy, dx);
        angles.push_back(a);
        angles.push_back(a - vertex_angle_offset);
        angles.push_back(a + vertex_angle_offset);
    };

    for (const Segment& s : segments) {
        add_endpoint(s.x1, s.y1);
        add_endpoint(s.x2, s.y2);
    }
    return angles;
}

std::vector<CandidateAngle> merge_angles(const std::vector<double>& base,
                                         const std::vector<double>& refinement,
                                         const std::vector<double>& vertices)
{
    std::vector<CandidateAngle> all;
    all.reserve(base.size() + refinement.size() + vertices.size());
    for (double a : base)       all.push_back({ normalize_angle(a), false });
    for (double a : refinement) all.push_back({ normalize_angle(a), false });
    for (double a : vertices)   all.push_back({ normalize_angle(a), true });

    std::sort(all.begin(), all.end(), [](const CandidateAngle& a, const CandidateAngle& b) {
        if (a.angle != b.angle) return a.angle < b.angle;
        return a.pinned > b.pinned;
    });

    std::vector<CandidateAngle> merged;
    merged.reserve(all.size());
    for (const CandidateAngle& c : all) {
        if (!merged.empty() && c.angle - merged.back().angle < angle_merge_epsilon) {
            CandidateAngle& last = merged.back();
            if (c.pinned && !last.pinned) last = c;
            continue;
        }
        merged.push_back(c);
    }

    // Across the wrap the angle near zero is kept.
    if (merged.size() > 1 &&
        merged.front().angle + two_pi - merged.back().angle < angle_merge_epsilon) {
        merged.front().pinned = merged.front().pinned || merged.back().pinned;
        merged.pop_back();
    }
    return merged;
}

std::vector<double> downsample_angles(const std::vector<CandidateAngle>& candidates,
                                      int budget)
{
    std::vector<double> out;
    const std::size_t n = candidates.size();
    const std::size_t limit = static_cast<std::size_t>(std::max(1, budget));

    if (n <= limit) {
        out.reserve(n);
        for (const CandidateAngle& c : candidates) out.push_back(c.angle);
        return out;
    }

    const std::size_t pinned = static_cast<std::size_t>(
        std::count_if(candidates.begin(), candidates.end(),
                      [](const CandidateAngle& c) { return c.pinned; }));

    if (pinned > limit) {
        const std::size_t step = (n + limit - 1) / limit;
        for (std::size_t i = 0; i < n; i += step) out.push_back(candidates[i].angle);
        return out;
    }

    const std::size_t free_count = n - pinned;
    const std::size_t free_budget = limit - pinned;
    const std::size_t step = free_budget > 0 ? (free_count + free_budget - 1) / free_budget : 0;

    out.reserve(limit);
    std::size_t free_seen = 0;
    for (const CandidateAngle& c : candidates) {
        if (c.pinned) {
            out.push_back(c.angle);
            continue;
        }
        if (step > 0 && free_seen % step == 0) out.push_back(c.angle);
        ++free_seen;
    }
    return out;
}

std::vector<Point> compute_visibility_polygon(const Point& origin,
                                              double radius,
                                              const std::vector<Segment>& segments,
                                              int min_rays,
                                              int max_rays,
                                              const SpatialIndex* index)
{
    std::vector<Point> points;

    if (segments.empty()) {
        points.reserve(circle_points);
        for (int i = 0; i < circle_points; ++i) {
            const double angle = (static_cast<double>(i) / circle_points) * two_pi;
            points.push_back({ origin.x + std::cos(angle) * radius,
                               origin.y + std::sin(angle) * radius });
        }
        return points;
    }

    const std::vector<double> base = base_ray_angles(min_rays);
    std::vector<double> base_distances;
    base_distances.reserve(base.size());
    for (double angle : base) {
        base_distances.push_back(cast_one(origin, angle, radius, segments, index));
    }

    const std::vector<double> edges = detect_edge_rays(base_distances, radius);
    const std::vector<double> refine = refinement_angles(edges, min_rays, max_rays);
    const std::vector<double> corners = vertex_angles(origin, radius, segments);

    const std::vector<double> angles =
        downsample_angles(merge_angles(base, refine, corners), std::max(max_rays, min_rays));

    points.reserve(angles.size());
    for (double angle : angles) {
        const double dist = cast_one(origin, angle, radius, segments, index);
        points.push_back({ origin.x + std::cos(angle) * dist,
                           origin.y + std::sin(angle) * dist });
    }
    return points;
}

std::vector<Point> compute_visibility_polygon(const Point& origin,
                                              double radius,
                                              const OccluderSet& occluders,
                                              int min_rays,
                                              int max_rays,
                                              const SpatialIndex* index)
{
    return compute_visibility_polygon(origin, radius, occluders.segments,
                                      min_rays, max_rays, index);
}

} // namespace visibility
