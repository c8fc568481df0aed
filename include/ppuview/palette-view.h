#pragma once

#include <ppuview/result.hpp>
#include <cstdint>
#include <string>

namespace ppuview {

// Which half of the Color Table the palette grid shows. Rows 0-7 are the
// background palettes, rows 8-15 the sprite palettes.
enum class ViewedPalettes : uint32_t {
    All = 0,
    BackgroundOnly = 1,
    SpritesOnly = 2,
};

// Host-side resolution of a ViewedPalettes value: the vertical texture
// range [v0, v1] the grid quad spans, and the number of visible rows.
struct PaletteViewMapping {
    float v0;
    float v1;
    uint32_t rowCount;
};

constexpr PaletteViewMapping paletteViewMapping(ViewedPalettes view) {
    switch (view) {
        case ViewedPalettes::BackgroundOnly: return {0.0f, 0.5f, 8};
        case ViewedPalettes::SpritesOnly:    return {0.5f, 1.0f, 8};
        case ViewedPalettes::All:            break;
    }
    return {0.0f, 1.0f, 16};
}

// "all", "background"/"bg", "sprites"/"sprite"
Result<ViewedPalettes> parseViewedPalettes(const std::string& name);
const char* viewedPalettesName(ViewedPalettes view);

} // namespace ppuview
