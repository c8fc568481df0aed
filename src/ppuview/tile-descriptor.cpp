#include <ppuview/tile-descriptor.h>
#include <cmath>
#include <string>

namespace ppuview {

constexpr uint32_t DEFAULT_SCALE = 8;
constexpr uint32_t SPRITE_TILE_BASE = 0x600;
constexpr uint32_t SPRITE_ROW_BASE = 8;

Result<TileDescriptor> TileDescriptor::make(int32_t x, int32_t y, uint32_t tileId,
                                            uint32_t scale, uint32_t colorRow,
                                            bool flipX, bool flipY) {
    if (tileId >= MAX_TILES) {
        return Err<TileDescriptor>("tile id " + std::to_string(tileId) +
                                   " beyond graphics table capacity " + std::to_string(MAX_TILES));
    }
    if (colorRow >= PALETTE_ROWS) {
        return Err<TileDescriptor>("color row " + std::to_string(colorRow) + " beyond 15");
    }
    if (scale > TileParams::SCALE_MASK) {
        return Err<TileDescriptor>("scale " + std::to_string(scale) + " does not fit in 8 bits");
    }
    return Ok(TileDescriptor{x, y, tileId, TileParams::pack(scale, colorRow, flipX, flipY)});
}

TileDescriptor TileDescriptor::fromBackgroundEntry(int32_t x, int32_t y, uint16_t entry) {
    uint32_t e = entry;
    uint32_t tile = e & 0x3FF;
    uint32_t row = (e >> 10) & 0x7;
    return {x, y, tile, DEFAULT_SCALE | (row << TileParams::COLOR_ROW_SHIFT) | (e & 0xC000)};
}

TileDescriptor TileDescriptor::fromSpriteEntry(int32_t x, int32_t y, uint16_t entry) {
    uint32_t e = entry;
    uint32_t tile = (e & 0x1FF) + SPRITE_TILE_BASE;
    uint32_t row = ((e >> 9) & 0x7) + SPRITE_ROW_BASE;
    return {x, y, tile, DEFAULT_SCALE | (row << TileParams::COLOR_ROW_SHIFT) | (e & 0xC000)};
}

void TileDescriptor::moveBy(int32_t dx, int32_t dy) {
    // Wraps on overflow
    x = static_cast<int32_t>(static_cast<uint32_t>(x) + static_cast<uint32_t>(dx));
    y = static_cast<int32_t>(static_cast<uint32_t>(y) + static_cast<uint32_t>(dy));
}

void TileDescriptor::snapToGrid(uint32_t cellSize, float originX, float originY) {
    if (cellSize == 0) return;
    float cell = static_cast<float>(cellSize);
    x = static_cast<int32_t>(std::floor((static_cast<float>(x) + originX) / cell) * cell);
    y = static_cast<int32_t>(std::floor((static_cast<float>(y) + originY) / cell) * cell);
}

} // namespace ppuview
