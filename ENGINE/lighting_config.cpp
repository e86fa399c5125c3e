// === File: lighting_config.cpp ===
#include "lighting_config.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

LightingConfig LightingConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("[LightingConfig] Expected a JSON object");
    }

    LightingConfig cfg;
    try {
        cfg.alpha_threshold     = j.value("alpha_threshold", cfg.alpha_threshold);
        cfg.simplify_epsilon    = j.value("simplify_epsilon", cfg.simplify_epsilon);
        cfg.light_radius        = j.value("light_radius", cfg.light_radius);
        cfg.min_rays            = j.value("min_rays", cfg.min_rays);
        cfg.max_rays            = j.value("max_rays", cfg.max_rays);
        cfg.use_spatial_index   = j.value("use_spatial_index", cfg.use_spatial_index);
        cfg.spatial_bucket_size = j.value("spatial_bucket_size", cfg.spatial_bucket_size);
        cfg.debug               = j.value("debug", cfg.debug);
        if (j.contains("polygon_cache_capacity")) {
            const long long cap = j["polygon_cache_capacity"].get<long long>();
            if (cap < 0) {
                throw std::invalid_argument("[LightingConfig] 'polygon_cache_capacity' must not be negative");
            }
            cfg.polygon_cache_capacity = static_cast<std::size_t>(cap);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("[LightingConfig] Bad value: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

LightingConfig LightingConfig::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("[LightingConfig] Failed to open JSON: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("[LightingConfig] Failed to parse " + path + ": " + e.what());
    }
    return from_json(j);
}

void LightingConfig::validate() const {
    if (alpha_threshold < 0 || alpha_threshold > 255)
        throw std::invalid_argument("[LightingConfig] 'alpha_threshold' must be in 0..255");
    if (!(simplify_epsilon >= 0.0))
        throw std::invalid_argument("[LightingConfig] 'simplify_epsilon' must not be negative");
    if (!(light_radius > 0.0))
        throw std::invalid_argument("[LightingConfig] 'light_radius' must be positive");
    if (min_rays < 1)
        throw std::invalid_argument("[LightingConfig] 'min_rays' must be at least 1");
    if (max_rays < min_rays)
        throw std::invalid_argument("[LightingConfig] 'max_rays' must be >= 'min_rays'");
    if (!(spatial_bucket_size > 0.0))
        throw std::invalid_argument("[LightingConfig] 'spatial_bucket_size' must be positive");
}

json LightingConfig::to_json() const {
    return json{
        { "alpha_threshold", alpha_threshold },
        { "simplify_epsilon", simplify_epsilon },
        { "light_radius", light_radius },
        { "min_rays", min_rays },
        { "max_rays", max_rays },
        { "use_spatial_index", use_spatial_index },
        { "spatial_bucket_size", spatial_bucket_size },
        { "polygon_cache_capacity", polygon_cache_capacity },
        { "debug", debug }
    };
}
