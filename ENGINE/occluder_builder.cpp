// === File: occluder_builder.cpp ===
#include "occluder_builder.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string occluder_signature(const std::vector<PlacedInstance>& instances) {
    std::vector<std::string> entries;
    entries.reserve(instances.size());

    for (const PlacedInstance& inst : instances) {
        if (!inst.is_occluder) continue;

        const Point c = inst.resolved_center();
        std::ostringstream oss;
        oss << inst.sprite_id << ':' << inst.cell_x << ':' << inst.cell_y << ':'
            << std::fixed << std::setprecision(4) << c.x << ':' << c.y << ':'
            << inst.rotation << ':' << (inst.mirror_x ? 1 : 0) << ':' << (inst.mirror_y ? 1 : 0) << ':'
            << std::setprecision(3) << inst.scale << ':'
            << inst.footprint.w << 'x' << inst.footprint.h;
        entries.push_back(oss.str());
    }

    std::sort(entries.begin(), entries.end());

    std::string signature;
    for (const std::string& e : entries) {
        if (!signature.empty()) signature += '|';
        signature += e;
    }
    return signature;
}

OccluderBuilder::OccluderBuilder(ContourCache& contours,
                                 AlphaSampler& sampler,
                                 int alpha_threshold,
                                 double simplify_epsilon,
                                 bool debug)
    : contours_(contours),
      sampler_(sampler),
      alpha_threshold_(alpha_threshold),
      simplify_epsilon_(simplify_epsilon),
      debug_(debug) {}

std::optional<std::size_t> OccluderBuilder::append_instance(const PlacedInstance& instance,
                                                            std::vector<Segment>& out,
                                                            BoundsAccumulator& bounds) const
{
    const FootprintCells oriented = instance.oriented_footprint();
    const double scale = instance.scale > 0.0 ? instance.scale : 1.0;
    const double extent_w = oriented.w * scale;
    const double extent_h = oriented.h * scale;
    if (extent_w <= 0.0 || extent_h <= 0.0) return 0;

    const Point center = instance.resolved_center();
    const double left = center.x - extent_w / 2.0;
    const double top  = center.y - extent_h / 2.0;

    ContourKey key;
    key.sprite_id        = instance.sprite_id;
    key.rotation         = ((instance.rotation % 4) + 4) % 4;
    key.mirror_x         = instance.mirror_x;
    key.mirror_y         = instance.mirror_y;
    key.alpha_threshold  = alpha_threshold_;
    key.simplify_epsilon = simplify_epsilon_ / std::max(extent_w, extent_h);

    const std::vector<Segment>& local = contours_.get(key, sampler_);
    if (!contours_.find(key)) return std::nullopt;

    for (const Segment& s : local) {
        const Segment world{ left + s.x1 * extent_w,
                             top  + s.y1 * extent_h,
                             left + s.x2 * extent_w,
                             top  + s.y2 * extent_h };
        out.push_back(world);
        bounds.add(world);
    }
    return local.size();
}

OccluderSet OccluderBuilder::build(const std::vector<PlacedInstance>& instances,
                                   const OccluderSet& previous) const
{
    OccluderSet result;
    BoundsAccumulator bounds;

    int occluding = 0;
    int contributing = 0;
    for (const PlacedInstance& inst : instances) {
        if (!inst.is_occluder) continue;
        ++occluding;
        const std::optional<std::size_t> added = append_instance(inst, result.segments, bounds);
        if (!added) {
            ++result.unavailable;
        } else if (*added > 0) {
            ++contributing;
        }
    }

    result.version = previous.version + 1;
    result.bounds = bounds.bounds();

    if (debug_) {
        std::cout << "[OccluderBuilder] Build complete: " << result.segments.size()
                  << " segments from " << contributing << "/" << occluding
                  << " occluders, version " << result.version;
        if (result.unavailable > 0) std::cout << ", " << result.unavailable << " sprites pending";
        std::cout << "\n";
    }
    return result;
}

const OccluderSet& OccluderCache::get(const std::vector<PlacedInstance>& instances,
                                      const OccluderBuilder& builder)
{
    std::string signature = occluder_signature(instances);
    if (signature_ && *signature_ == signature && current_.unavailable == 0) {
        return current_;
    }

    current_ = builder.build(instances, current_);
    signature_ = std::move(signature);
    ++rebuilds_;
    return current_;
}

void OccluderCache::invalidate() {
    // Keep the version so post-invalidation builds never reuse an old number.
    current_.segments.clear();
    current_.bounds = Bounds{};
    current_.unavailable = 0;
    signature_.reset();
}
