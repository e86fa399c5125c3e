// === File: polygon_cache.cpp ===
#include "polygon_cache.hpp"

#include <cstring>

namespace {

uint64_t double_bits(double v) {
    if (v == 0.0) v = 0.0; // fold -0.0 into +0.0
    uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

} // namespace

PolygonCacheKey PolygonCacheKey::make(const Point& origin, double radius, uint64_t version) {
    PolygonCacheKey key;
    key.x = double_bits(origin.x);
    key.y = double_bits(origin.y);
    key.radius = double_bits(radius);
    key.version = version;
    return key;
}

PolygonCache::PolygonCache(std::size_t capacity)
    : capacity_(capacity) {}

const PolygonCache::Polygon* PolygonCache::find(const PolygonCacheKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

const PolygonCache::Polygon& PolygonCache::get_or_compute(const PolygonCacheKey& key,
                                                          const std::function<Polygon()>& compute)
{
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    evict_to_fit();
    auto [inserted, ok] = entries_.emplace(key, compute());
    (void)ok;
    order_.push_back(key);
    return inserted->second;
}

void PolygonCache::evict_to_fit() {
    if (capacity_ == 0) return;
    while (entries_.size() >= capacity_ && !order_.empty()) {
        entries_.erase(order_.front());
        order_.pop_front();
    }
}

void PolygonCache::clear() {
    entries_.clear();
    order_.clear();
}
