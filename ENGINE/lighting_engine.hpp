// === File: lighting_engine.hpp ===
#pragma once

#include <optional>
#include <vector>
#include "alpha_grid.hpp"
#include "contour_tracer.hpp"
#include "light_source.hpp"
#include "lighting_config.hpp"
#include "occluder_builder.hpp"
#include "placed_instance.hpp"
#include "polygon_cache.hpp"
#include "spatial_index.hpp"

/**
 * Shadow geometry for one map. Owns the contour, occluder and polygon caches
 * and, when enabled, a spatial index that follows the occluder version.
 *
 * Typical frame:
 *   engine.build_occluder_set(instances);
 *   auto regions = engine.compute_lit_regions(lights);
 *
 * References returned by the getters stay valid until the next call that
 * touches the same cache.
 */
class LightingEngine {
public:
    LightingEngine(const LightingConfig& config, AlphaSampler& sampler);

    const std::vector<Segment>& extract_contour(const ContourKey& key);

    // Rebuilds only when the occluder signature changed.
    const OccluderSet& build_occluder_set(const std::vector<PlacedInstance>& instances);

    // Against the last built occluder set; radius <= 0 uses the config radius.
    const std::vector<Point>& compute_visibility_polygon(const Point& origin, double radius = 0.0);

    std::vector<LitRegion> compute_lit_regions(const std::vector<LightSource>& lights);

    void invalidate_contour_cache();
    void invalidate_occluder_cache();
    void invalidate_polygon_cache();

    const LightingConfig& config() const { return config_; }
    ContourCache& contours() { return contours_; }
    const OccluderCache& occluders() const { return occluders_; }
    const PolygonCache& polygons() const { return polygons_; }
    const SpatialIndex* spatial_index();

private:
    LightingConfig config_;
    AlphaSampler& sampler_;
    ContourCache contours_;
    OccluderBuilder builder_;
    OccluderCache occluders_;
    PolygonCache polygons_;
    std::optional<SpatialIndex> index_;
};
