// === File: scene.hpp ===
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "light_source.hpp"
#include "placed_instance.hpp"

// Map snapshot fed to the probe: placed sprites and the lights shining on them.
struct Scene {
    std::string sprite_root = ".";
    std::vector<PlacedInstance> instances;
    std::vector<LightSource> lights;
};

// Throws std::runtime_error with a "[Scene]" prefix on malformed input.
Scene scene_from_json(const nlohmann::json& j);
Scene load_scene(const std::string& path);

nlohmann::json lit_regions_to_json(const std::vector<LitRegion>& regions, uint64_t occluder_version);
