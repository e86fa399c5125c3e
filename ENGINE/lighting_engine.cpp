// === File: lighting_engine.cpp ===
#include "lighting_engine.hpp"
#include "visibility_polygon.hpp"

#include <iostream>

LightingEngine::LightingEngine(const LightingConfig& config, AlphaSampler& sampler)
    : config_(config),
      sampler_(sampler),
      contours_(config.debug),
      builder_(contours_, sampler, config.alpha_threshold, config.simplify_epsilon, config.debug),
      polygons_(config.polygon_cache_capacity)
{
    config_.validate();
}

const std::vector<Segment>& LightingEngine::extract_contour(const ContourKey& key) {
    return contours_.get(key, sampler_);
}

const OccluderSet& LightingEngine::build_occluder_set(const std::vector<PlacedInstance>& instances) {
    const std::size_t before = occluders_.rebuilds();
    const OccluderSet& set = occluders_.get(instances, builder_);
    if (config_.debug && occluders_.rebuilds() == before) {
        std::cout << "[LightingEngine] Occluders unchanged, reusing version " << set.version << "\n";
    }
    return set;
}

const SpatialIndex* LightingEngine::spatial_index() {
    if (!config_.use_spatial_index) return nullptr;

    const OccluderSet& current = occluders_.current();
    if (!index_ || index_->version() != current.version) {
        index_ = SpatialIndex::build(current, config_.spatial_bucket_size);
        if (config_.debug) {
            std::cout << "[LightingEngine] Spatial index rebuilt: " << index_->bucket_count()
                      << " buckets for version " << current.version << "\n";
        }
    }
    return &*index_;
}

const std::vector<Point>& LightingEngine::compute_visibility_polygon(const Point& origin, double radius) {
    const double r = radius > 0.0 ? radius : config_.light_radius;
    const OccluderSet& occluders = occluders_.current();
    const PolygonCacheKey key = PolygonCacheKey::make(origin, r, occluders.version);

    return polygons_.get_or_compute(key, [&]() {
        return visibility::compute_visibility_polygon(origin, r, occluders,
                                                      config_.min_rays, config_.max_rays,
                                                      spatial_index());
    });
}

std::vector<LitRegion> LightingEngine::compute_lit_regions(const std::vector<LightSource>& lights) {
    std::vector<LitRegion> regions;
    regions.reserve(lights.size());

    for (const LightSource& light : lights) {
        LitRegion region;
        region.light = light;
        region.origin = light.center();
        region.radius = light.radius && *light.radius > 0.0 ? *light.radius : config_.light_radius;
        region.polygon = compute_visibility_polygon(region.origin, region.radius);
        regions.push_back(std::move(region));
    }

    if (config_.debug) {
        std::cout << "[LightingEngine] " << regions.size() << " lit regions, polygon cache "
                  << polygons_.hits() << " hits / " << polygons_.misses() << " misses\n";
    }
    return regions;
}

// Outlines feed the occluder set, so a reload has to rebuild it too.
void LightingEngine::invalidate_contour_cache() {
    contours_.clear();
    invalidate_occluder_cache();
}

void LightingEngine::invalidate_occluder_cache() {
    // The version survives, so cached polygons for it would describe the
    // dropped geometry.
    occluders_.invalidate();
    index_.reset();
    polygons_.clear();
}

void LightingEngine::invalidate_polygon_cache() {
    polygons_.clear();
}
