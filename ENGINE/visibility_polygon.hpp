// === File: visibility_polygon.hpp ===
#pragma once

#include <vector>
#include "geometry.hpp"

class SpatialIndex;
struct OccluderSet;

namespace visibility {

constexpr int    circle_points          = 32;
constexpr double edge_distance_fraction = 0.05;
constexpr double vertex_angle_offset    = 0.0003;
constexpr double angle_merge_epsilon    = 1e-9;

// One ray direction. Pinned angles aim at occluder endpoints and survive
// downsampling.
struct CandidateAngle {
    double angle = 0.0;
    bool pinned = false;
};

// Wraps into [0, 2pi).
double normalize_angle(double angle);

// min_rays evenly spaced angles starting at 0.
std::vector<double> base_ray_angles(int min_rays);

// Angles of base rays whose distance differs from either neighbour by more
// than 5% of the radius. distances[i] belongs to base ray i.
std::vector<double> detect_edge_rays(const std::vector<double>& distances, double radius);

// Spreads max_rays - min_rays extra rays over the flagged edges, symmetric
// around each edge and inside one base step.
std::vector<double> refinement_angles(const std::vector<double>& edge_angles,
                                      int min_rays,
                                      int max_rays);

// Bearing of every segment endpoint within radius, plus the same bearing
// nudged by +/- vertex_angle_offset.
std::vector<double> vertex_angles(const Point& origin,
                                  double radius,
                                  const std::vector<Segment>& segments);

// Normalizes, sorts and folds angles closer than angle_merge_epsilon.
// Vertex angles are pinned.
std::vector<CandidateAngle> merge_angles(const std::vector<double>& base,
                                         const std::vector<double>& refinement,
                                         const std::vector<double>& vertices);

// Cuts the candidate list to at most budget angles, keeping all pinned ones
// when they fit and striding over the rest. Output is sorted.
std::vector<double> downsample_angles(const std::vector<CandidateAngle>& candidates,
                                      int budget);

/**
 * Closed polygon of the region lit by a point light of the given radius.
 * Vertices are ordered by increasing angle from the origin. Without segments
 * the result is a 32 point circle. Passing an index only changes which
 * segments each ray tests, never the result.
 */
std::vector<Point> compute_visibility_polygon(const Point& origin,
                                              double radius,
                                              const std::vector<Segment>& segments,
                                              int min_rays,
                                              int max_rays,
                                              const SpatialIndex* index = nullptr);

std::vector<Point> compute_visibility_polygon(const Point& origin,
                                              double radius,
                                              const OccluderSet& occluders,
                                              int min_rays,
                                              int max_rays,
                                              const SpatialIndex* index = nullptr);

} // namespace visibility
