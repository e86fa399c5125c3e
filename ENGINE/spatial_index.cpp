// === File: spatial_index.cpp ===
#include "spatial_index.hpp"
#include "occluder_builder.hpp"

#include <algorithm>
#include <cmath>

namespace {

// Upper bound on bucket probes per ray; the clipped span is walked in at
// most this many steps.
constexpr long long max_ray_steps = 1LL << 22;

// Narrows [t0, t1] to where origin + t * dir lies inside [lo, hi] on one axis.
bool clip_axis(double origin, double dir, double lo, double hi, double& t0, double& t1) {
    if (dir == 0.0) return origin >= lo && origin <= hi;
    double a = (lo - origin) / dir;
    double b = (hi - origin) / dir;
    if (a > b) std::swap(a, b);
    t0 = std::max(t0, a);
    t1 = std::min(t1, b);
    return t0 <= t1;
}

} // namespace

SpatialIndex::SpatialIndex(const std::vector<Segment>& segments, double bucket_size)
    : bucket_size_(bucket_size > 0.0 ? bucket_size : 2.0)
{
    BoundsAccumulator acc;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const Segment& s = segments[i];
        acc.add(s);

        const long long min_bx = bucket_coord(std::min(s.x1, s.x2));
        const long long max_bx = bucket_coord(std::max(s.x1, s.x2));
        const long long min_by = bucket_coord(std::min(s.y1, s.y2));
        const long long max_by = bucket_coord(std::max(s.y1, s.y2));

        for (long long bx = min_bx; bx <= max_bx; ++bx) {
            for (long long by = min_by; by <= max_by; ++by) {
                buckets_[bucket_key(bx, by)].push_back(i);
            }
        }
    }
    bounds_ = acc.bounds();
}

SpatialIndex SpatialIndex::build(const OccluderSet& occluders, double bucket_size) {
    SpatialIndex index(occluders.segments, bucket_size);
    index.version_ = occluders.version;
    index.bounds_ = occluders.bounds;
    return index;
}

uint64_t SpatialIndex::bucket_key(long long bx, long long by) {
    return (static_cast<uint64_t>(bx) << 32) ^ (static_cast<uint64_t>(by) & 0xffffffffULL);
}

long long SpatialIndex::bucket_coord(double v) const {
    return static_cast<long long>(std::floor(v / bucket_size_));
}

std::vector<std::size_t> SpatialIndex::segments_along_ray(const Point& origin,
                                                          double dir_x,
                                                          double dir_y,
                                                          double max_dist) const
{
    std::vector<std::size_t> result;
    if (buckets_.empty()) return result;

    // Segments only live inside bounds_, so the walk covers just that stretch
    // of the ray, padded by one bucket.
    double t_enter = 0.0;
    double t_exit = std::max(0.0, max_dist);
    if (!clip_axis(origin.x, dir_x, bounds_.min_x - bucket_size_, bounds_.max_x + bucket_size_,
                   t_enter, t_exit) ||
        !clip_axis(origin.y, dir_y, bounds_.min_y - bucket_size_, bounds_.max_y + bucket_size_,
                   t_enter, t_exit)) {
        return result;
    }

    // Half-bucket steps plus the 3x3 neighbourhood keep grazing rays covered.
    const double step = bucket_size_ / 2.0;
    const double span = t_exit - t_enter;
    const double wanted = std::ceil(span / step);
    const long long steps = wanted < 1.0 ? 1
                          : wanted > static_cast<double>(max_ray_steps) ? max_ray_steps
                          : static_cast<long long>(wanted);

    long long last_bx = 0;
    long long last_by = 0;
    bool have_last = false;

    for (long long i = 0; i <= steps; ++i) {
        const double t = t_enter + (static_cast<double>(i) / steps) * span;
        const long long bx = bucket_coord(origin.x + dir_x * t);
        const long long by = bucket_coord(origin.y + dir_y * t);
        if (have_last && bx == last_bx && by == last_by) continue;
        last_bx = bx;
        last_by = by;
        have_last = true;

        for (long long dx = -1; dx <= 1; ++dx) {
            for (long long dy = -1; dy <= 1; ++dy) {
                auto it = buckets_.find(bucket_key(bx + dx, by + dy));
                if (it == buckets_.end()) continue;
                result.insert(result.end(), it->second.begin(), it->second.end());
            }
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}
