// === File: ray_intersection.hpp ===
#pragma once

#include <optional>
#include <vector>
#include "geometry.hpp"

class SpatialIndex;

namespace ray {

constexpr double parallel_epsilon = 1e-8;
constexpr double hit_epsilon      = 1e-6;

/**
 * Distance along the ray origin + t * (dir_x, dir_y) to the segment, or
 * nullopt when the two are (nearly) parallel, the hit lies behind the origin
 * or outside the segment. Zero-length segments are rejected as parallel.
 * With a unit direction the result is a distance in world units.
 */
std::optional<double> intersect_segment(const Point& origin,
                                        double dir_x,
                                        double dir_y,
                                        const Segment& segment);

// Closest hit among all segments, clipped to max_dist.
double cast(const Point& origin, double angle, double max_dist,
            const std::vector<Segment>& segments);

// Same, but only tests the segments the index returns for this ray.
double cast(const Point& origin, double angle, double max_dist,
            const std::vector<Segment>& segments, const SpatialIndex& index);

struct Hit {
    double x = 0.0;
    double y = 0.0;
    double dist = 0.0;
};

// ray_count evenly spaced rays starting at angle 0.
std::vector<Hit> cast_radial(const Point& origin, double max_dist,
                             const std::vector<Segment>& segments, int ray_count);

} // namespace ray
