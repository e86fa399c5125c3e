// === File: ray_intersection.cpp ===
#include "ray_intersection.hpp"
#include "spatial_index.hpp"

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace ray {

std::optional<double> intersect_segment(const Point& origin,
                                        double dir_x,
                                        double dir_y,
                                        const Segment& segment)
{
    const double seg_dx = segment.x2 - segment.x1;
    const double seg_dy = segment.y2 - segment.y1;

    const double cross = dir_x * seg_dy - dir_y * seg_dx;
    if (std::fabs(cross) < parallel_epsilon) return std::nullopt;

    const double dx = segment.x1 - origin.x;
    const double dy = segment.y1 - origin.y;

    const double t = (dx * seg_dy - dy * seg_dx) / cross;
    const double s = (dx * dir_y - dy * dir_x) / cross;

    if (t >= -hit_epsilon && s >= -hit_epsilon && s <= 1.0 + hit_epsilon) {
        return std::max(0.0, t);
    }
    return std::nullopt;
}

double cast(const Point& origin, double angle, double max_dist,
            const std::vector<Segment>& segments)
{
    const double dir_x = std::cos(angle);
    const double dir_y = std::sin(angle);

    double closest = max_dist;
    for (const Segment& s : segments) {
        if (auto d = intersect_segment(origin, dir_x, dir_y, s); d && *d < closest) {
            closest = *d;
        }
    }
    return closest;
}

double cast(const Point& origin, double angle, double max_dist,
            const std::vector<Segment>& segments, const SpatialIndex& index)
{
    const double dir_x = std::cos(angle);
    const double dir_y = std::sin(angle);

    double closest = max_dist;
    for (std::size_t idx : index.segments_along_ray(origin, dir_x, dir_y, max_dist)) {
        if (idx >= segments.size()) continue;
        if (auto d = intersect_segment(origin, dir_x, dir_y, segments[idx]); d && *d < closest) {
            closest = *d;
        }
    }
    return closest;
}

std::vector<Hit> cast_radial(const Point& origin, double max_dist,
                             const std::vector<Segment>& segments, int ray_count)
{
    std::vector<Hit> hits;
    if (ray_count <= 0) return hits;
    hits.reserve(static_cast<std::size_t>(ray_count));

    const double step = (2.0 * M_PI) / ray_count;
    for (int i = 0; i < ray_count; ++i) {
        const double angle = i * step;
        const double dist = cast(origin, angle, max_dist, segments);
        hits.push_back({ origin.x + std::cos(angle) * dist,
                         origin.y + std::sin(angle) * dist,
                         dist });
    }
    return hits;
}

} // namespace ray
