#pragma once

#include <ppuview/result.hpp>
#include <cstdint>

namespace ppuview {

// Capacity of the Graphics Table: the whole 64 KiB of VRAM as 128-bit
// records, two records per 4bpp tile.
constexpr uint32_t GRAPHICS_RECORD_COUNT = 4096;
constexpr uint32_t GRAPHICS_RECORD_BYTES = 16;
constexpr uint32_t GRAPHICS_TABLE_BYTES = GRAPHICS_RECORD_COUNT * GRAPHICS_RECORD_BYTES;
constexpr uint32_t TILE_BYTES = 32;
constexpr uint32_t MAX_TILES = GRAPHICS_RECORD_COUNT / 2;

constexpr uint32_t PALETTE_ROWS = 16;
constexpr uint32_t PALETTE_COLUMNS = 16;
constexpr uint32_t COLOR_TABLE_SIZE = PALETTE_ROWS * PALETTE_COLUMNS;

// Bit layout of TileDescriptor::params
namespace TileParams {
constexpr uint32_t SCALE_MASK = 0x00FF;
constexpr uint32_t COLOR_ROW_SHIFT = 8;
constexpr uint32_t COLOR_ROW_MASK = 0x0F00;
constexpr uint32_t FLIP_X = 0x4000;
constexpr uint32_t FLIP_Y = 0x8000;

constexpr uint32_t pack(uint32_t scale, uint32_t colorRow, bool flipX, bool flipY) {
    return (scale & SCALE_MASK)
         | ((colorRow << COLOR_ROW_SHIFT) & COLOR_ROW_MASK)
         | (flipX ? FLIP_X : 0u)
         | (flipY ? FLIP_Y : 0u);
}

constexpr uint32_t scale(uint32_t params) { return params & SCALE_MASK; }
constexpr uint32_t colorRow(uint32_t params) { return (params & COLOR_ROW_MASK) >> COLOR_ROW_SHIFT; }
constexpr bool flipX(uint32_t params) { return (params & FLIP_X) != 0; }
constexpr bool flipY(uint32_t params) { return (params & FLIP_Y) != 0; }
} // namespace TileParams

/**
 * One rendered tile instance. Uploaded verbatim as a vec4<u32> instance
 * attribute: (x, y, tileId, params). x and y are signed screen-space
 * anchors (top-left corner, pre-zoom pixels).
 */
struct TileDescriptor {
    int32_t x = 0;
    int32_t y = 0;
    uint32_t tileId = 0;
    uint32_t params = 0;

    /**
     * Build a descriptor, rejecting fields that would address outside the
     * Graphics Table or Color Table.
     */
    static Result<TileDescriptor> make(int32_t x, int32_t y, uint32_t tileId,
                                       uint32_t scale, uint32_t colorRow,
                                       bool flipX = false, bool flipY = false);

    // SNES BG tilemap word: vhopppcc cccccccc
    static TileDescriptor fromBackgroundEntry(int32_t x, int32_t y, uint16_t entry);

    // Sprite tile word as used by the OAM mirror: tiles live in the upper
    // VRAM half (0x600+) and use palette rows 8-15.
    static TileDescriptor fromSpriteEntry(int32_t x, int32_t y, uint16_t entry);

    uint32_t scale() const { return TileParams::scale(params); }
    uint32_t colorRow() const { return TileParams::colorRow(params); }
    bool flipX() const { return TileParams::flipX(params); }
    bool flipY() const { return TileParams::flipY(params); }

    void moveBy(int32_t dx, int32_t dy);

    // Snap the anchor down to the grid of cellSize pixels whose origin is
    // at (-originX, -originY)
    void snapToGrid(uint32_t cellSize, float originX, float originY);

    bool operator==(const TileDescriptor&) const = default;
};

static_assert(sizeof(TileDescriptor) == 16, "TileDescriptor must match vec4<u32>");

} // namespace ppuview
