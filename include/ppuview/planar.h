#pragma once

#include <ppuview/tile-descriptor.h>
#include <array>
#include <cstddef>
#include <cstdint>

namespace ppuview {
namespace planar {

// 64 color indices, row-major, 0..15 each
using TileIndices = std::array<uint8_t, 64>;

// The 32 bytes of one 4bpp tile (bitplanes 0/1 then 2/3)
using TileBytes = std::array<uint8_t, TILE_BYTES>;

// The two 128-bit records of a tile seen as eight little-endian words:
// words 0-3 are record tileId*2, words 4-7 are record tileId*2+1.
using TileWords = std::array<uint32_t, 8>;

/**
 * Load the records of tile `tileId` from a Graphics Table image.
 * Reads past `size` yield zero words.
 */
TileWords loadTile(const uint8_t* gfx, size_t size, uint32_t tileId);

/**
 * Planar-to-chunky rule for one pixel of a tile, (x, y) in [0,7].
 * Same bit order as the tile fragment shader.
 */
constexpr uint32_t decodePixel(const TileWords& words, uint32_t x, uint32_t y) {
    uint32_t shift = (y % 2) * 16;
    uint32_t lo = (words[y / 2] >> shift) & 0xFFFF;
    uint32_t hi = (words[4 + y / 2] >> shift) & 0xFFFF;
    return ((lo >> (7 - x)) & 1)
         | (((lo >> (15 - x)) & 1) << 1)
         | (((hi >> (7 - x)) & 1) << 2)
         | (((hi >> (15 - x)) & 1) << 3);
}

TileIndices decodeTile(const TileWords& words);

// Inverse of decodeTile; indices are masked to 4 bits
TileBytes encodeTile(const TileIndices& indices);

/**
 * Map a fragment's texture coordinate (post-zoom pixels from the quad
 * corner) back onto the native 8x8 grid, clamped to [0,7].
 */
uint32_t intraTileCoord(float t, uint32_t scale, float zoom);

constexpr uint32_t paletteIndex(uint32_t colorIndex, uint32_t colorRow) {
    return colorIndex + colorRow * PALETTE_COLUMNS;
}

} // namespace planar
} // namespace ppuview
