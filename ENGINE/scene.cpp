// === File: scene.cpp ===
#include "scene.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

PlacedInstance parse_instance(const json& e) {
    if (!e.is_object() || !e.contains("sprite")) {
        throw std::runtime_error("[Scene] Instance entry needs a 'sprite'");
    }

    PlacedInstance inst;
    inst.sprite_id   = e.at("sprite").get<std::string>();
    inst.cell_x      = e.value("cell_x", 0);
    inst.cell_y      = e.value("cell_y", 0);
    inst.rotation    = e.value("rotation", 0);
    inst.mirror_x    = e.value("mirror_x", false);
    inst.mirror_y    = e.value("mirror_y", false);
    inst.scale       = e.value("scale", 1.0);
    inst.is_occluder = e.value("occluder", false);

    if (e.contains("footprint")) {
        const json& f = e["footprint"];
        if (!f.is_array() || f.size() != 2)
            throw std::runtime_error("[Scene] 'footprint' must be [w, h] for " + inst.sprite_id);
        inst.footprint = { f[0].get<int>(), f[1].get<int>() };
    } else {
        inst.footprint = footprint_from_sprite_id(inst.sprite_id);
    }

    if (e.contains("center")) {
        const json& c = e["center"];
        if (!c.is_array() || c.size() != 2)
            throw std::runtime_error("[Scene] 'center' must be [x, y] for " + inst.sprite_id);
        inst.center = Point{ c[0].get<double>(), c[1].get<double>() };
    }

    if (inst.rotation < 0 || inst.rotation > 3)
        throw std::runtime_error("[Scene] 'rotation' must be 0..3 for " + inst.sprite_id);
    return inst;
}

LightSource parse_light(const json& e) {
    if (!e.is_object()) {
        throw std::runtime_error("[Scene] Light entry must be an object");
    }
    LightSource light;
    light.cell_x = e.value("cell_x", 0);
    light.cell_y = e.value("cell_y", 0);
    if (e.contains("radius")) {
        light.radius = e["radius"].get<double>();
    }
    return light;
}

} // namespace

Scene scene_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("[Scene] Expected a JSON object");
    }

    Scene scene;
    try {
        scene.sprite_root = j.value("sprite_root", scene.sprite_root);
        if (j.contains("instances")) {
            for (const auto& e : j.at("instances")) scene.instances.push_back(parse_instance(e));
        }
        if (j.contains("lights")) {
            for (const auto& e : j.at("lights")) scene.lights.push_back(parse_light(e));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("[Scene] Bad value: ") + e.what());
    }
    return scene;
}

Scene load_scene(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("[Scene] Failed to open JSON: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("[Scene] Failed to parse " + path + ": " + e.what());
    }
    return scene_from_json(j);
}

json lit_regions_to_json(const std::vector<LitRegion>& regions, uint64_t occluder_version) {
    json out;
    out["occluder_version"] = occluder_version;
    out["lights"] = json::array();

    for (const LitRegion& r : regions) {
        json points = json::array();
        for (const Point& p : r.polygon) points.push_back({ p.x, p.y });

        out["lights"].push_back({
            { "cell_x", r.light.cell_x },
            { "cell_y", r.light.cell_y },
            { "origin", { r.origin.x, r.origin.y } },
            { "radius", r.radius },
            { "polygon", std::move(points) }
        });
    }
    return out;
}
