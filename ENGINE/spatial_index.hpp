// === File: spatial_index.hpp ===
#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>
#include "geometry.hpp"

struct OccluderSet;

/**
 * Uniform bucket grid over world segments. Each segment is listed in every
 * bucket its bounding box touches. Used as a broad phase for ray casts; it
 * only narrows the candidate list and never decides visibility.
 */
class SpatialIndex {
public:
    SpatialIndex() = default;
    SpatialIndex(const std::vector<Segment>& segments, double bucket_size);

    static SpatialIndex build(const OccluderSet& occluders, double bucket_size = 2.0);

    // Sorted, de-duplicated indices of segments that may cross the ray
    // origin + t * dir for t in [0, max_dist]. dir must be unit length.
    std::vector<std::size_t> segments_along_ray(const Point& origin,
                                                double dir_x,
                                                double dir_y,
                                                double max_dist) const;

    double bucket_size() const { return bucket_size_; }
    std::size_t bucket_count() const { return buckets_.size(); }
    uint64_t version() const { return version_; }
    const Bounds& bounds() const { return bounds_; }

private:
    static uint64_t bucket_key(long long bx, long long by);
    long long bucket_coord(double v) const;

    std::unordered_map<uint64_t, std::vector<std::size_t>> buckets_;
    double bucket_size_ = 2.0;
    uint64_t version_ = 0;
    Bounds bounds_;
};
