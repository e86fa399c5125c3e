// === File: placed_instance.hpp ===
#pragma once

#include <optional>
#include <string>
#include "geometry.hpp"
#include "sprite_footprint.hpp"

// One sprite placed on the map, in cell coordinates.
struct PlacedInstance {
    std::string sprite_id;
    int cell_x = 0;
    int cell_y = 0;
    std::optional<Point> center;   // overrides the cell-derived centre when set
    int rotation = 0;              // quarter turns clockwise, 0..3
    bool mirror_x = false;
    bool mirror_y = false;
    double scale = 1.0;
    FootprintCells footprint;      // unrotated size in cells
    bool is_occluder = false;      // decided by the host's tag metadata

    // Footprint after rotation; odd quarter turns swap the axes.
    FootprintCells oriented_footprint() const {
        return (rotation & 1) == 0 ? footprint : FootprintCells{ footprint.h, footprint.w };
    }

    Point resolved_center() const {
        if (center) return *center;
        const FootprintCells f = oriented_footprint();
        return { cell_x + f.w / 2.0, cell_y + f.h / 2.0 };
    }
};
