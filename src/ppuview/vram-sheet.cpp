#include <ppuview/vram-sheet.h>

namespace ppuview {
namespace vram {

std::vector<TileDescriptor> sheetTiles(uint32_t scale) {
    std::vector<TileDescriptor> tiles;
    tiles.reserve(SHEET_COLUMNS * SHEET_ROWS);

    for (uint32_t t = 0; t < SHEET_COLUMNS * SHEET_ROWS; t++) {
        int32_t x = static_cast<int32_t>((t % SHEET_COLUMNS) * scale);
        int32_t y = static_cast<int32_t>((t / SHEET_COLUMNS) * scale);
        uint32_t tile, row;
        if (t < SHEET_COLUMNS * BACKGROUND_SHEET_ROWS) {
            tile = t & 0x3FF;
            row = (t >> 10) & 0x7;
        } else {
            tile = (t & 0x1FF) + 0x600;
            row = ((t >> 9) & 0x7) + 8;
        }
        tiles.push_back({x, y, tile, TileParams::pack(scale, row, false, false)});
    }
    return tiles;
}

SheetView sheetView(ViewedVramTiles view, uint32_t scale) {
    switch (view) {
        case ViewedVramTiles::BackgroundOnly:
            return {BACKGROUND_SHEET_ROWS, 0.0f};
        case ViewedVramTiles::SpritesOnly:
            return {SHEET_ROWS - BACKGROUND_SHEET_ROWS,
                    -static_cast<float>(BACKGROUND_SHEET_ROWS * scale)};
        case ViewedVramTiles::All:
            break;
    }
    return {SHEET_ROWS, 0.0f};
}

Result<ViewedVramTiles> parseViewedVramTiles(const std::string& name) {
    if (name == "all") return Ok(ViewedVramTiles::All);
    if (name == "background" || name == "bg") return Ok(ViewedVramTiles::BackgroundOnly);
    if (name == "sprites" || name == "sprite") return Ok(ViewedVramTiles::SpritesOnly);
    return Err<ViewedVramTiles>("unknown VRAM view '" + name + "'");
}

} // namespace vram
} // namespace ppuview
