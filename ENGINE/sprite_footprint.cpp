// === File: sprite_footprint.cpp ===
#include "sprite_footprint.hpp"

#include <regex>

FootprintCells footprint_from_sprite_id(const std::string& sprite_id) {
    static const std::regex size_tag(R"(_(\d+)X(\d+)_)", std::regex::icase);

    std::smatch match;
    if (std::regex_search(sprite_id, match, size_tag)) {
        try {
            const int w = std::stoi(match[1].str());
            const int h = std::stoi(match[2].str());
            if (w > 0 && h > 0) return { w, h };
        } catch (const std::out_of_range&) {
            // absurdly long digit run, fall through to the default
        }
    }
    return {};
}
