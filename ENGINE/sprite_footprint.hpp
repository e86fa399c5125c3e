// === File: sprite_footprint.hpp ===
#pragma once

#include <string>

// Size of a sprite on the map grid, in cells, before rotation.
struct FootprintCells {
    int w = 1;
    int h = 1;
};

// Reads the "_<W>X<H>_" tag sprite files carry in their name
// (e.g. "stone_wall_2X1_a.png"). Untagged sprites occupy one cell.
FootprintCells footprint_from_sprite_id(const std::string& sprite_id);
