// === File: polygon_cache.hpp ===
#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <tuple>
#include <vector>
#include "geometry.hpp"

// Exact light position and radius, tied to the occluder geometry they were
// computed against. Coordinates are compared by bit pattern, so two lights
// share an entry only when their doubles are identical.
struct PolygonCacheKey {
    uint64_t x = 0;
    uint64_t y = 0;
    uint64_t radius = 0;
    uint64_t version = 0;

    static PolygonCacheKey make(const Point& origin, double radius, uint64_t version);

    bool operator<(const PolygonCacheKey& o) const {
        return std::tie(x, y, radius, version) < std::tie(o.x, o.y, o.radius, o.version);
    }
    bool operator==(const PolygonCacheKey& o) const {
        return x == o.x && y == o.y && radius == o.radius && version == o.version;
    }
};

/**
 * Visibility polygons keyed by light and occluder version. When full, the
 * oldest entry is dropped first. A capacity of 0 means unbounded.
 */
class PolygonCache {
public:
    using Polygon = std::vector<Point>;

    explicit PolygonCache(std::size_t capacity = 256);

    const Polygon* find(const PolygonCacheKey& key) const;

    const Polygon& get_or_compute(const PolygonCacheKey& key,
                                  const std::function<Polygon()>& compute);

    void clear();

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    std::size_t hits() const { return hits_; }
    std::size_t misses() const { return misses_; }

private:
    void evict_to_fit();

    std::map<PolygonCacheKey, Polygon> entries_;
    std::deque<PolygonCacheKey> order_;
    std::size_t capacity_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};
