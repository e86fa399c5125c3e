// === File: alpha_grid.cpp ===
#include "alpha_grid.hpp"

AlphaGrid orient_alpha_grid(const AlphaGrid& source, int rotation, bool mirror_x, bool mirror_y) {
    AlphaGrid out;
    if (!source.valid()) return out;

    const int rot = ((rotation % 4) + 4) % 4;
    const bool swap_axes = (rot % 2) != 0;
    out.width  = swap_axes ? source.height : source.width;
    out.height = swap_axes ? source.width : source.height;
    out.alpha.resize(static_cast<std::size_t>(out.width) * out.height);

    // Work in doubled, centred coordinates so pixel centres stay integral.
    for (int v = 0; v < out.height; ++v) {
        for (int u = 0; u < out.width; ++u) {
            const int ox = 2 * u + 1 - out.width;
            const int oy = 2 * v + 1 - out.height;

            // Undo the clockwise rotation.
            int sx = ox;
            int sy = oy;
            switch (rot) {
                case 1: sx = oy;  sy = -ox; break;
                case 2: sx = -ox; sy = -oy; break;
                case 3: sx = -oy; sy = ox;  break;
                default: break;
            }

            // Undo the mirror.
            if (mirror_x) sx = -sx;
            if (mirror_y) sy = -sy;

            const int px = (sx + source.width - 1) / 2;
            const int py = (sy + source.height - 1) / 2;
            out.alpha[static_cast<std::size_t>(v) * out.width + u] = source.at(px, py);
        }
    }
    return out;
}
