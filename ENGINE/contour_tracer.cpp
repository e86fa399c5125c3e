// === File: contour_tracer.cpp ===
#include "contour_tracer.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Marching squares leaves a staircase of just under half a pixel on every
// diagonal; the simplifier never keeps deviations this small.
constexpr double staircase_tolerance_px = 0.5;

constexpr int cache_format_version = 1;

long long quantized_epsilon(double eps) {
    return std::llround(eps * 10000.0);
}

// Endpoints all sit on the half-pixel lattice, so doubling them gives an exact key.
uint64_t lattice_key(const Point& p) {
    const auto kx = static_cast<uint64_t>(std::llround(p.x * 2.0));
    const auto ky = static_cast<uint64_t>(std::llround(p.y * 2.0));
    return (kx << 32) ^ (ky & 0xffffffffULL);
}

double perpendicular_distance(const Point& p, const Point& a, const Point& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len_sq = dx * dx + dy * dy;

    if (len_sq == 0.0) {
        return std::hypot(p.x - a.x, p.y - a.y);
    }

    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / len_sq;
    t = std::clamp(t, 0.0, 1.0);
    return std::hypot(p.x - (a.x + t * dx), p.y - (a.y + t * dy));
}

void simplify_range(const std::vector<Point>& pts,
                    std::size_t first,
                    std::size_t last,
                    double epsilon,
                    std::vector<Point>& out)
{
    double max_dist = 0.0;
    std::size_t max_idx = first;

    for (std::size_t i = first + 1; i < last; ++i) {
        const double d = perpendicular_distance(pts[i], pts[first], pts[last]);
        if (d > max_dist) {
            max_dist = d;
            max_idx = i;
        }
    }

    if (max_dist > epsilon) {
        simplify_range(pts, first, max_idx, epsilon, out);
        out.pop_back(); // joint is re-added by the right half
        simplify_range(pts, max_idx, last, epsilon, out);
        return;
    }

    out.push_back(pts[first]);
    out.push_back(pts[last]);
}

} // namespace

bool ContourKey::operator<(const ContourKey& other) const {
    return std::make_tuple(sprite_id, rotation, mirror_x, mirror_y, alpha_threshold,
                           quantized_epsilon(simplify_epsilon)) <
           std::make_tuple(other.sprite_id, other.rotation, other.mirror_x, other.mirror_y,
                           other.alpha_threshold, quantized_epsilon(other.simplify_epsilon));
}

std::string ContourKey::to_string() const {
    std::ostringstream oss;
    oss << sprite_id << '|' << rotation << '|' << (mirror_x ? 1 : 0) << '|'
        << (mirror_y ? 1 : 0) << '|' << alpha_threshold << '|'
        << std::fixed << std::setprecision(4) << simplify_epsilon;
    return oss.str();
}

namespace contour {

std::vector<Segment> marching_squares(const std::vector<uint8_t>& solid, int w, int h) {
    std::vector<Segment> edges;
    if (w <= 0 || h <= 0 || solid.size() != static_cast<std::size_t>(w) * h) return edges;

    auto sample = [&](int x, int y) -> int {
        if (x < 0 || y < 0 || x >= w || y >= h) return 0;
        return solid[static_cast<std::size_t>(y) * w + x] ? 1 : 0;
    };

    auto push = [&](const Point& a, const Point& b) {
        edges.push_back({ a.x, a.y, b.x, b.y });
    };

    // Windows start at -1 so the empty frame closes outlines touching the border.
    for (int y = -1; y < h; ++y) {
        for (int x = -1; x < w; ++x) {
            const int tl = sample(x, y);
            const int tr = sample(x + 1, y);
            const int br = sample(x + 1, y + 1);
            const int bl = sample(x, y + 1);

            const int index = (tl << 3) | (tr << 2) | (br << 1) | bl;
            if (index == 0 || index == 15) continue;

            const Point top    { x + 1.0, y + 0.5 };
            const Point right  { x + 1.5, y + 1.0 };
            const Point bottom { x + 1.0, y + 1.5 };
            const Point left   { x + 0.5, y + 1.0 };

            switch (index) {
                case 1:  push(left, bottom); break;
                case 2:  push(bottom, right); break;
                case 3:  push(left, right); break;
                case 4:  push(right, top); break;
                case 5:  // saddle, fixed split
                    push(left, top);
                    push(bottom, right);
                    break;
                case 6:  push(bottom, top); break;
                case 7:  push(left, top); break;
                case 8:  push(top, left); break;
                case 9:  push(top, bottom); break;
                case 10: // saddle, fixed split
                    push(top, right);
                    push(left, bottom);
                    break;
                case 11: push(top, right); break;
                case 12: push(right, left); break;
                case 13: push(bottom, right); break;
                case 14: push(left, bottom); break;
                default: break;
            }
        }
    }

    return edges;
}

std::vector<std::vector<Point>> chain_edges(const std::vector<Segment>& edges) {
    std::vector<std::vector<Point>> polylines;
    if (edges.empty()) return polylines;

    // Endpoint -> edges touching it, in ascending edge order.
    std::unordered_map<uint64_t, std::vector<std::size_t>> by_endpoint;
    by_endpoint.reserve(edges.size() * 2);
    for (std::size_t i = 0; i < edges.size(); ++i) {
        by_endpoint[lattice_key({ edges[i].x1, edges[i].y1 })].push_back(i);
        by_endpoint[lattice_key({ edges[i].x2, edges[i].y2 })].push_back(i);
    }

    std::vector<bool> used(edges.size(), false);

    auto next_edge = [&](const Point& p) -> long long {
        auto it = by_endpoint.find(lattice_key(p));
        if (it == by_endpoint.end()) return -1;
        for (std::size_t idx : it->second) {
            if (!used[idx]) return static_cast<long long>(idx);
        }
        return -1;
    };

    for (std::size_t start = 0; start < edges.size(); ++start) {
        if (used[start]) continue;

        std::vector<Point> line;
        long long current = static_cast<long long>(start);

        while (current >= 0) {
            const Segment& e = edges[static_cast<std::size_t>(current)];
            used[static_cast<std::size_t>(current)] = true;

            const Point a{ e.x1, e.y1 };
            const Point b{ e.x2, e.y2 };
            if (line.empty()) {
                line.push_back(a);
                line.push_back(b);
            } else if (lattice_key(line.back()) == lattice_key(a)) {
                line.push_back(b);
            } else {
                line.push_back(a);
            }

            current = next_edge(line.back());
        }

        if (line.size() >= 2) polylines.push_back(std::move(line));
    }

    return polylines;
}

std::vector<Point> douglas_peucker(const std::vector<Point>& points, double epsilon) {
    if (points.size() <= 2) return points;

    std::vector<Point> out;
    out.reserve(points.size());
    simplify_range(points, 0, points.size() - 1, epsilon, out);
    return out;
}

std::vector<Segment> trace(const AlphaGrid& grid, int alpha_threshold, double simplify_epsilon) {
    std::vector<Segment> result;
    if (!grid.valid() || grid.width < 2 || grid.height < 2) return result;

    std::vector<uint8_t> solid(grid.alpha.size());
    bool any_solid = false;
    for (std::size_t i = 0; i < grid.alpha.size(); ++i) {
        solid[i] = grid.alpha[i] > alpha_threshold ? 1 : 0;
        any_solid = any_solid || solid[i];
    }
    if (!any_solid) return result;

    const std::vector<Segment> edges = marching_squares(solid, grid.width, grid.height);
    const std::vector<std::vector<Point>> polylines = chain_edges(edges);

    const double longest = static_cast<double>(std::max(grid.width, grid.height));
    const double tolerance_px = std::max(simplify_epsilon * longest, staircase_tolerance_px);
    const double inv_w = 1.0 / grid.width;
    const double inv_h = 1.0 / grid.height;

    for (const auto& line : polylines) {
        const std::vector<Point> simplified = douglas_peucker(line, tolerance_px);
        for (std::size_t i = 0; i + 1 < simplified.size(); ++i) {
            result.push_back({ simplified[i].x * inv_w,
                               simplified[i].y * inv_h,
                               simplified[i + 1].x * inv_w,
                               simplified[i + 1].y * inv_h });
        }
    }

    return result;
}

} // namespace contour

ContourCache::ContourCache(bool debug)
    : debug_(debug) {}

const std::vector<Segment>& ContourCache::get(const ContourKey& key, AlphaSampler& sampler) {
    auto it = entries_.find(key);
    if (it != entries_.end()) return it->second;

    const AlphaGrid grid = sampler.sample(key.sprite_id, key.rotation, key.mirror_x, key.mirror_y);
    if (!grid.valid()) {
        if (debug_) {
            std::cout << "[ContourCache] No alpha grid for " << key.sprite_id << "\n";
        }
        return unavailable_;
    }

    std::vector<Segment> segments = contour::trace(grid, key.alpha_threshold, key.simplify_epsilon);
    ++traces_;

    if (debug_) {
        std::cout << "[ContourCache] Traced " << segments.size() << " segments for "
                  << fs::path(key.sprite_id).filename().string()
                  << " (eps=" << std::fixed << std::setprecision(4) << key.simplify_epsilon
                  << ")" << std::defaultfloat << "\n";
    }

    return entries_.emplace(key, std::move(segments)).first->second;
}

const std::vector<Segment>* ContourCache::find(const ContourKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

void ContourCache::put(const ContourKey& key, std::vector<Segment> segments) {
    entries_[key] = std::move(segments);
}

void ContourCache::clear() {
    entries_.clear();
}

bool ContourCache::save(const std::string& path) const {
    json doc;
    doc["format"] = cache_format_version;
    doc["entries"] = json::array();

    for (const auto& [key, segments] : entries_) {
        json entry;
        entry["sprite"]    = key.sprite_id;
        entry["rotation"]  = key.rotation;
        entry["mirror_x"]  = key.mirror_x;
        entry["mirror_y"]  = key.mirror_y;
        entry["threshold"] = key.alpha_threshold;
        entry["epsilon"]   = key.simplify_epsilon;

        json segs = json::array();
        for (const Segment& s : segments) {
            segs.push_back({ s.x1, s.y1, s.x2, s.y2 });
        }
        entry["segments"] = std::move(segs);
        doc["entries"].push_back(std::move(entry));
    }

    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[ContourCache] Failed to create " << target.parent_path().string()
                      << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "[ContourCache] Failed to open for writing: " << path << "\n";
        return false;
    }
    out << doc.dump(2);
    return static_cast<bool>(out);
}

bool ContourCache::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        std::cerr << "[ContourCache] Corrupt cache file " << path << ": " << e.what() << "\n";
        return false;
    }

    if (!doc.is_object() || doc.value("format", 0) != cache_format_version || !doc.contains("entries") ||
        !doc["entries"].is_array()) {
        std::cerr << "[ContourCache] Ignoring cache with unknown format: " << path << "\n";
        return false;
    }

    std::map<ContourKey, std::vector<Segment>> loaded;
    try {
        for (const auto& entry : doc["entries"]) {
            ContourKey key;
            key.sprite_id        = entry.at("sprite").get<std::string>();
            key.rotation         = entry.at("rotation").get<int>();
            key.mirror_x         = entry.at("mirror_x").get<bool>();
            key.mirror_y         = entry.at("mirror_y").get<bool>();
            key.alpha_threshold  = entry.at("threshold").get<int>();
            key.simplify_epsilon = entry.at("epsilon").get<double>();

            std::vector<Segment> segments;
            for (const auto& s : entry.at("segments")) {
                if (!s.is_array() || s.size() != 4) continue;
                segments.push_back({ s[0].get<double>(), s[1].get<double>(),
                                     s[2].get<double>(), s[3].get<double>() });
            }
            loaded[key] = std::move(segments);
        }
    } catch (const json::exception& e) {
        std::cerr << "[ContourCache] Bad entry in " << path << ": " << e.what() << "\n";
        return false;
    }

    for (auto& [key, segments] : loaded) {
        entries_[key] = std::move(segments);
    }

    if (debug_) {
        std::cout << "[ContourCache] Loaded " << loaded.size() << " outlines from " << path << "\n";
    }
    return true;
}
