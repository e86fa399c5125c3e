// === File: occluder_builder.hpp ===
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "contour_tracer.hpp"
#include "geometry.hpp"
#include "placed_instance.hpp"

// World-space light blockers for one map state.
struct OccluderSet {
    std::vector<Segment> segments;   // world cells
    uint64_t version = 0;
    Bounds bounds;
    std::size_t unavailable = 0;     // occluders whose sprite had no alpha grid yet
};

// Order-independent digest of the occluding instances' identity and pose.
// Non-occluders are ignored.
std::string occluder_signature(const std::vector<PlacedInstance>& instances);

/**
 * Turns placed occluders into world segments using the contour cache.
 *
 * Each instance is laid over its oriented footprint times its scale, centred
 * on its resolved centre. The contour tolerance is divided by the larger side
 * of that extent so outlines keep the same fidelity in cells whatever the
 * sprite size.
 */
class OccluderBuilder {
public:
    OccluderBuilder(ContourCache& contours,
                    AlphaSampler& sampler,
                    int alpha_threshold,
                    double simplify_epsilon,
                    bool debug = false);

    // Always rebuilds; the result's version is previous.version + 1.
    OccluderSet build(const std::vector<PlacedInstance>& instances,
                      const OccluderSet& previous) const;

    // Appends one instance's world segments and returns how many were added,
    // or nullopt when the sampler had no grid for the sprite.
    std::optional<std::size_t> append_instance(const PlacedInstance& instance,
                                               std::vector<Segment>& out,
                                               BoundsAccumulator& bounds) const;

private:
    ContourCache& contours_;
    AlphaSampler& sampler_;
    int alpha_threshold_;
    double simplify_epsilon_;
    bool debug_;
};

/**
 * Holds the last built OccluderSet and rebuilds only when the occluder
 * signature changes, or while some occluder's sprite is still unavailable.
 * Versions keep increasing across invalidate().
 */
class OccluderCache {
public:
    const OccluderSet& get(const std::vector<PlacedInstance>& instances,
                           const OccluderBuilder& builder);

    void invalidate();

    bool has_value() const { return signature_.has_value(); }
    const OccluderSet& current() const { return current_; }
    std::size_t rebuilds() const { return rebuilds_; }

private:
    OccluderSet current_;
    std::optional<std::string> signature_;
    std::size_t rebuilds_ = 0;
};
