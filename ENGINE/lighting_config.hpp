// === File: lighting_config.hpp ===
#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Tunables for occluder tracing and visibility. Distances are in cells.
struct LightingConfig {
    int    alpha_threshold        = 128;
    double simplify_epsilon       = 0.02;
    double light_radius           = 4.0;
    int    min_rays               = 540;
    int    max_rays               = 1080;
    bool   use_spatial_index      = false;
    double spatial_bucket_size    = 2.0;
    std::size_t polygon_cache_capacity = 256;
    bool   debug                  = false;

    // Missing keys keep their defaults. Throws std::invalid_argument on
    // out-of-range values and std::runtime_error on wrongly typed ones.
    static LightingConfig from_json(const nlohmann::json& j);

    // Throws std::runtime_error when the file is missing or not valid JSON.
    static LightingConfig load_from_file(const std::string& path);

    void validate() const;
    nlohmann::json to_json() const;
};
