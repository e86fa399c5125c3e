// === File: sdl_alpha_sampler.hpp ===
#pragma once

#include <map>
#include <set>
#include <string>
#include "alpha_grid.hpp"

/**
 * AlphaSampler backed by image files under a sprite root, loaded with
 * SDL_image. Sprites are reduced so their longer side is at most max_dim
 * pixels, then oriented per request. Unoriented grids are kept per sprite id.
 *
 * Requires SDL_Init and IMG_Init to have been called.
 */
class SdlAlphaSampler : public AlphaSampler {
public:
    explicit SdlAlphaSampler(std::string sprite_root, int max_dim = 512, bool debug = false);

    AlphaGrid sample(const std::string& sprite_id,
                     int rotation,
                     bool mirror_x,
                     bool mirror_y) override;

    void clear() { grids_.clear(); failed_.clear(); }

private:
    AlphaGrid load(const std::string& sprite_id);

    std::string sprite_root_;
    int max_dim_;
    bool debug_;
    std::map<std::string, AlphaGrid> grids_;
    std::set<std::string> failed_;
};
