#pragma once

#include <cstdint>

#include <imgui.h>

#include "core/Types.hpp"

namespace game2048::gui_sdl {

struct TileTheme {
    // Board frame and empty cells
    static ImU32 boardBackground() { return IM_COL32(187, 173, 160, 255); }
    static ImU32 emptyCell()       { return IM_COL32(205, 193, 180, 255); }
    static ImU32 flash()           { return IM_COL32(255, 255, 255, 255); }

    static ImU32 overlayBackground() { return IM_COL32(238, 228, 218, 190); }
    static ImU32 overlayText()       { return IM_COL32(119, 110, 101, 255); }

    // Tile fill per value; anything above 4096 uses the dark fallback
    static ImU32 tileBackground(core::TileValue v) {
        switch (v) {
        case 2:    return IM_COL32(238, 228, 218, 255);
        case 4:    return IM_COL32(237, 224, 200, 255);
        case 8:    return IM_COL32(237, 200,  80, 255);
        case 16:   return IM_COL32(237, 197,  63, 255);
        case 32:   return IM_COL32(246, 124,  95, 255);
        case 64:   return IM_COL32(246,  94,  59, 255);
        case 128:  return IM_COL32(237, 207, 114, 255);
        case 256:  return IM_COL32(237, 204,  97, 255);
        case 512:  return IM_COL32(242, 177, 121, 255);
        case 1024: return IM_COL32(245, 149,  99, 255);
        case 2048: return IM_COL32(237, 194,  46, 255);
        case 4096: return IM_COL32(238, 203,  47, 255);
        default:   return IM_COL32( 60,  58,  50, 255);
        }
    }

    // Digits: dark on the pale tiles, light elsewhere
    static ImU32 tileText(core::TileValue v) {
        switch (v) {
        case 2:
        case 4:
        case 512:
            return IM_COL32(119, 110, 101, 255);
        default:
            return IM_COL32(249, 246, 242, 255);
        }
    }
};

inline void unpackImU32(ImU32 col, std::uint8_t& r, std::uint8_t& g, std::uint8_t& b, std::uint8_t& a)
{
    r = (col >> IM_COL32_R_SHIFT) & 0xFF;
    g = (col >> IM_COL32_G_SHIFT) & 0xFF;
    b = (col >> IM_COL32_B_SHIFT) & 0xFF;
    a = (col >> IM_COL32_A_SHIFT) & 0xFF;
}

} // namespace game2048::gui_sdl
