#include "../polygon_cache.hpp"

#include <gtest/gtest.h>

namespace {

PolygonCache::Polygon triangle(double s) {
    return { { 0, 0 }, { s, 0 }, { 0, s } };
}

} // namespace

TEST(PolygonCacheKeyTest, NearbyLightsGetDistinctKeys) {
    EXPECT_EQ(PolygonCacheKey::make({ 1.25, 2.0 }, 4.0, 3), PolygonCacheKey::make({ 1.25, 2.0 }, 4.0, 3));
    EXPECT_EQ(PolygonCacheKey::make({ 0.0, 2.0 }, 4.0, 3), PolygonCacheKey::make({ -0.0, 2.0 }, 4.0, 3));
    EXPECT_FALSE(PolygonCacheKey::make({ 0.0, 0.3 }, 5.0, 1) == PolygonCacheKey::make({ 0.004, 0.3 }, 5.0, 1));
    EXPECT_FALSE(PolygonCacheKey::make({ 1.0, 2.0 }, 4.0, 3) == PolygonCacheKey::make({ 1.0, 2.0 }, 4.001, 3));
    EXPECT_FALSE(PolygonCacheKey::make({ 1.0, 2.0 }, 4.0, 3) == PolygonCacheKey::make({ 1.0, 2.0 }, 4.0, 4));
    EXPECT_FALSE(PolygonCacheKey::make({ 1.0, 2.0 }, 4.0, 3) == PolygonCacheKey::make({ 1.0, 2.0 }, 4.5, 3));
}

TEST(PolygonCacheTest, ComputesOncePerKey) {
    PolygonCache cache;
    int computed = 0;
    auto compute = [&]() { ++computed; return triangle(1.0); };

    const auto key = PolygonCacheKey::make({ 0.5, 0.5 }, 4.0, 1);
    cache.get_or_compute(key, compute);
    const auto& again = cache.get_or_compute(key, compute);

    EXPECT_EQ(computed, 1);
    EXPECT_EQ(again.size(), 3u);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(PolygonCacheTest, NewVersionMisses) {
    PolygonCache cache;
    cache.get_or_compute(PolygonCacheKey::make({ 0.5, 0.5 }, 4.0, 1), [] { return triangle(1.0); });
    EXPECT_EQ(cache.find(PolygonCacheKey::make({ 0.5, 0.5 }, 4.0, 2)), nullptr);
}

TEST(PolygonCacheTest, EvictsOldestWhenFull) {
    PolygonCache cache(2);
    const auto a = PolygonCacheKey::make({ 0, 0 }, 1.0, 1);
    const auto b = PolygonCacheKey::make({ 1, 0 }, 1.0, 1);
    const auto c = PolygonCacheKey::make({ 2, 0 }, 1.0, 1);

    cache.get_or_compute(a, [] { return triangle(1.0); });
    cache.get_or_compute(b, [] { return triangle(2.0); });
    cache.get_or_compute(c, [] { return triangle(3.0); });

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.find(a), nullptr);
    ASSERT_NE(cache.find(c), nullptr);
    EXPECT_DOUBLE_EQ((*cache.find(c))[1].x, 3.0);
}

TEST(PolygonCacheTest, ZeroCapacityIsUnbounded) {
    PolygonCache cache(0);
    for (int i = 0; i < 50; ++i) {
        cache.get_or_compute(PolygonCacheKey::make({ double(i), 0 }, 1.0, 1), [] { return triangle(1.0); });
    }
    EXPECT_EQ(cache.size(), 50u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}
