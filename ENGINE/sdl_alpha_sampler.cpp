// === File: sdl_alpha_sampler.cpp ===
#include "sdl_alpha_sampler.hpp"

#include <SDL.h>
#include <SDL_image.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

SdlAlphaSampler::SdlAlphaSampler(std::string sprite_root, int max_dim, bool debug)
    : sprite_root_(std::move(sprite_root)),
      max_dim_(max_dim > 0 ? max_dim : 512),
      debug_(debug) {}

AlphaGrid SdlAlphaSampler::sample(const std::string& sprite_id,
                                  int rotation,
                                  bool mirror_x,
                                  bool mirror_y)
{
    auto it = grids_.find(sprite_id);
    if (it == grids_.end()) {
        AlphaGrid grid = load(sprite_id);
        if (!grid.valid()) return AlphaGrid{};
        it = grids_.emplace(sprite_id, std::move(grid)).first;
    }
    return orient_alpha_grid(it->second, rotation, mirror_x, mirror_y);
}

AlphaGrid SdlAlphaSampler::load(const std::string& sprite_id) {
    const std::string path = (fs::path(sprite_root_) / sprite_id).string();
    const bool first_failure = failed_.find(sprite_id) == failed_.end();

    SDL_Surface* loaded = IMG_Load(path.c_str());
    if (!loaded) {
        if (first_failure) {
            std::cerr << "[SdlAlphaSampler] IMG_Load failed for " << path << ": " << IMG_GetError() << "\n";
            failed_.insert(sprite_id);
        }
        return AlphaGrid{};
    }

    SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
    SDL_FreeSurface(loaded);
    if (!rgba) {
        std::cerr << "[SdlAlphaSampler] Failed to convert " << path << ": " << SDL_GetError() << "\n";
        return AlphaGrid{};
    }

    // Downsample so the longer side fits max_dim_.
    const int longest = std::max(rgba->w, rgba->h);
    if (longest > max_dim_) {
        const double factor = static_cast<double>(max_dim_) / longest;
        const int w = std::max(1, static_cast<int>(std::lround(rgba->w * factor)));
        const int h = std::max(1, static_cast<int>(std::lround(rgba->h * factor)));

        SDL_Surface* scaled = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
        if (!scaled) {
            std::cerr << "[SdlAlphaSampler] Failed to create surface: " << SDL_GetError() << "\n";
            SDL_FreeSurface(rgba);
            return AlphaGrid{};
        }
        SDL_SetSurfaceBlendMode(rgba, SDL_BLENDMODE_NONE);
        if (SDL_BlitScaled(rgba, nullptr, scaled, nullptr) != 0) {
            std::cerr << "[SdlAlphaSampler] Failed to scale " << path << ": " << SDL_GetError() << "\n";
            SDL_FreeSurface(scaled);
            SDL_FreeSurface(rgba);
            return AlphaGrid{};
        }
        SDL_FreeSurface(rgba);
        rgba = scaled;
    }

    if (SDL_LockSurface(rgba) != 0) {
        std::cerr << "[SdlAlphaSampler] Failed to lock surface: " << SDL_GetError() << "\n";
        SDL_FreeSurface(rgba);
        return AlphaGrid{};
    }

    AlphaGrid grid;
    grid.width = rgba->w;
    grid.height = rgba->h;
    grid.alpha.resize(static_cast<std::size_t>(grid.width) * grid.height);

    const Uint32* pixels = static_cast<const Uint32*>(rgba->pixels);
    for (int y = 0; y < grid.height; ++y) {
        const Uint32* row = pixels + y * (rgba->pitch / 4);
        for (int x = 0; x < grid.width; ++x) {
            Uint8 r, g, b, a;
            SDL_GetRGBA(row[x], rgba->format, &r, &g, &b, &a);
            grid.alpha[static_cast<std::size_t>(y) * grid.width + x] = a;
        }
    }

    SDL_UnlockSurface(rgba);
    SDL_FreeSurface(rgba);
    failed_.erase(sprite_id);

    if (debug_) {
        std::cout << "[SdlAlphaSampler] Loaded " << sprite_id << " as "
                  << grid.width << "x" << grid.height << " alpha grid\n";
    }
    return grid;
}
