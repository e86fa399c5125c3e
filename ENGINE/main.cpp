// === File: main.cpp ===

#include "lighting_config.hpp"
#include "lighting_engine.hpp"
#include "scene.hpp"
#include "sdl_alpha_sampler.hpp"

#include <SDL.h>
#include <SDL_image.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cerr << "usage: lumen_probe <scene.json> [--config lighting.json] [--cache contours.json] [--out polygons.json]\n";
}

int run(const std::string& scene_path,
        const std::string& config_path,
        const std::string& cache_path,
        const std::string& out_path)
{
    const LightingConfig config = config_path.empty() ? LightingConfig{}
                                                      : LightingConfig::load_from_file(config_path);
    const Scene scene = load_scene(scene_path);

    SdlAlphaSampler sampler(scene.sprite_root, 512, config.debug);
    LightingEngine engine(config, sampler);

    if (!cache_path.empty() && engine.contours().load(cache_path)) {
        std::cout << "[Main] Loaded " << engine.contours().size() << " cached contours\n";
    }

    const OccluderSet& occluders = engine.build_occluder_set(scene.instances);
    std::cout << "[Main] " << occluders.segments.size() << " occluder segments (version "
              << occluders.version << ")\n";

    const std::vector<LitRegion> regions = engine.compute_lit_regions(scene.lights);
    for (const LitRegion& r : regions) {
        std::cout << "[Main] Light (" << r.light.cell_x << ", " << r.light.cell_y << ") r="
                  << r.radius << ": " << r.polygon.size() << " vertices\n";
    }

    const nlohmann::json result = lit_regions_to_json(regions, occluders.version);
    if (out_path.empty()) {
        std::cout << result.dump(2) << "\n";
    } else {
        const fs::path out(out_path);
        if (out.has_parent_path()) fs::create_directories(out.parent_path());
        std::ofstream file(out_path);
        if (!file) throw std::runtime_error("[Main] Failed to open output: " + out_path);
        file << result.dump(2) << "\n";
        std::cout << "[Main] Wrote " << out_path << "\n";
    }

    if (!cache_path.empty() && !engine.contours().save(cache_path)) {
        std::cerr << "[Main] Could not write contour cache " << cache_path << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string scene_path;
    std::string config_path;
    std::string cache_path;
    std::string out_path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        bool ok = true;
        if (arg == "--config")      ok = next(config_path);
        else if (arg == "--cache")  ok = next(cache_path);
        else if (arg == "--out")    ok = next(out_path);
        else if (scene_path.empty() && arg.rfind("--", 0) != 0) scene_path = arg;
        else ok = false;

        if (!ok) {
            print_usage();
            return 1;
        }
    }
    if (scene_path.empty()) {
        print_usage();
        return 1;
    }

    // === SDL Subsystem Initialization ===
    if (SDL_Init(0) < 0) {
        std::cerr << "[Main] SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }
    if (!(IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG)) {
        std::cerr << "[Main] IMG_Init failed: " << IMG_GetError() << "\n";
        SDL_Quit();
        return 1;
    }

    int status = 1;
    try {
        status = run(scene_path, config_path, cache_path, out_path);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        status = 1;
    }

    IMG_Quit();
    SDL_Quit();
    return status;
}
