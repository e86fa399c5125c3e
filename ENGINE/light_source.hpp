// === File: light_source.hpp ===

#pragma once

#include <optional>
#include <vector>
#include "geometry.hpp"

// A point light anchored to a map cell. It shines from the cell centre.
struct LightSource {
    int cell_x = 0;
    int cell_y = 0;
    std::optional<double> radius;   // cells; falls back to the config radius

    Point center() const { return { cell_x + 0.5, cell_y + 0.5 }; }
};

// Lit area of one light for the current occluder geometry.
struct LitRegion {
    LightSource light;
    Point origin;
    double radius = 0.0;
    std::vector<Point> polygon;
};
