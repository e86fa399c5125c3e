// === File: contour_tracer.hpp ===
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>
#include "alpha_grid.hpp"
#include "geometry.hpp"

/**
 * Identifies one traced outline: a sprite variant plus the parameters used to
 * binarize and simplify it. The tolerance is compared at four decimals, so
 * nearly identical tolerances share an entry.
 */
struct ContourKey {
    std::string sprite_id;
    int rotation = 0;
    bool mirror_x = false;
    bool mirror_y = false;
    int alpha_threshold = 128;
    double simplify_epsilon = 0.01;

    bool operator<(const ContourKey& other) const;
    std::string to_string() const;
};

namespace contour {

// Edges between solid and empty samples, in pixel units. Pixel (i, j) is
// sampled at its centre and the grid is framed by one ring of empty samples.
std::vector<Segment> marching_squares(const std::vector<uint8_t>& solid, int w, int h);

// Greedily joins edges that share an endpoint into polylines.
std::vector<std::vector<Point>> chain_edges(const std::vector<Segment>& edges);

// Recursive Douglas-Peucker. Endpoints are always kept.
std::vector<Point> douglas_peucker(const std::vector<Point>& points, double epsilon);

// Full pipeline: threshold, march, chain, simplify, normalize to 0..1.
// Grids smaller than 2x2 or malformed grids produce no segments.
std::vector<Segment> trace(const AlphaGrid& grid, int alpha_threshold, double simplify_epsilon);

} // namespace contour

/**
 * Memoizes traced outlines per ContourKey. Entries live until clear().
 * Not synchronized; one owner thread.
 */
class ContourCache {
public:
    explicit ContourCache(bool debug = false);

    // Returns the cached outline or traces it from sampler output. A sampler
    // that has no grid for the sprite yields an empty outline that is not
    // remembered, so the sprite is retried once it becomes available.
    const std::vector<Segment>& get(const ContourKey& key, AlphaSampler& sampler);

    const std::vector<Segment>* find(const ContourKey& key) const;
    void put(const ContourKey& key, std::vector<Segment> segments);

    void clear();
    std::size_t size() const { return entries_.size(); }
    std::size_t traces() const { return traces_; }

    bool save(const std::string& path) const;
    bool load(const std::string& path);

private:
    std::map<ContourKey, std::vector<Segment>> entries_;
    std::vector<Segment> unavailable_;
    std::size_t traces_ = 0;
    bool debug_ = false;
};
