#pragma once

#include <ppuview/result.hpp>
#include <ppuview/tile-descriptor.h>
#include <cstdint>
#include <string>
#include <vector>

namespace ppuview {
namespace vram {

// 16 tiles per sheet row; the first 32 rows are background tiles, the
// last 32 rows sprite tiles.
constexpr uint32_t SHEET_COLUMNS = 16;
constexpr uint32_t SHEET_ROWS = 64;
constexpr uint32_t BACKGROUND_SHEET_ROWS = 32;

enum class ViewedVramTiles : uint32_t {
    All = 0,
    BackgroundOnly = 1,
    SpritesOnly = 2,
};

struct SheetView {
    uint32_t rows;    // visible sheet rows
    float offsetY;    // vertical pan in pre-zoom pixels
};

std::vector<TileDescriptor> sheetTiles(uint32_t scale);
SheetView sheetView(ViewedVramTiles view, uint32_t scale);

Result<ViewedVramTiles> parseViewedVramTiles(const std::string& name);

} // namespace vram
} // namespace ppuview
