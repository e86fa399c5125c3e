// === File: alpha_grid.hpp ===
#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Row-major alpha channel of one sprite variant, one byte per pixel.
struct AlphaGrid {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> alpha;

    bool valid() const {
        return width > 0 && height > 0 &&
               alpha.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }

    uint8_t at(int x, int y) const { return alpha[static_cast<std::size_t>(y) * width + x]; }
};

// Returns the grid as it appears on the map: mirrored first, then rotated
// clockwise by rotation * 90 degrees about its centre. Odd rotations swap
// width and height. Invalid grids come back empty.
AlphaGrid orient_alpha_grid(const AlphaGrid& source, int rotation, bool mirror_x, bool mirror_y);

// Supplies the transparency mask of an oriented sprite variant. Implementations
// return an empty AlphaGrid when the sprite is unknown or not loaded yet.
class AlphaSampler {
public:
    virtual ~AlphaSampler() = default;

    virtual AlphaGrid sample(const std::string& sprite_id,
                             int rotation,
                             bool mirror_x,
                             bool mirror_y) = 0;
};
