#include <ppuview/planar.h>
#include <algorithm>
#include <cmath>

namespace ppuview {
namespace planar {

TileWords loadTile(const uint8_t* gfx, size_t size, uint32_t tileId) {
    TileWords words = {};
    size_t base = static_cast<size_t>(tileId) * TILE_BYTES;
    for (size_t w = 0; w < words.size(); w++) {
        uint32_t value = 0;
        for (size_t b = 0; b < 4; b++) {
            size_t offset = base + w * 4 + b;
            if (gfx && offset < size) {
                value |= static_cast<uint32_t>(gfx[offset]) << (b * 8);
            }
        }
        words[w] = value;
    }
    return words;
}

TileIndices decodeTile(const TileWords& words) {
    TileIndices indices = {};
    for (uint32_t y = 0; y < 8; y++) {
        for (uint32_t x = 0; x < 8; x++) {
            indices[y * 8 + x] = static_cast<uint8_t>(decodePixel(words, x, y));
        }
    }
    return indices;
}

TileBytes encodeTile(const TileIndices& indices) {
    TileBytes bytes = {};
    for (uint32_t y = 0; y < 8; y++) {
        for (uint32_t x = 0; x < 8; x++) {
            uint32_t index = indices[y * 8 + x] & 0xF;
            uint8_t mask = static_cast<uint8_t>(0x80 >> x);
            if (index & 1) bytes[2 * y + 0x00] |= mask;
            if (index & 2) bytes[2 * y + 0x01] |= mask;
            if (index & 4) bytes[2 * y + 0x10] |= mask;
            if (index & 8) bytes[2 * y + 0x11] |= mask;
        }
    }
    return bytes;
}

uint32_t intraTileCoord(float t, uint32_t scale, float zoom) {
    float extent = static_cast<float>(scale) * zoom;
    if (extent <= 0.0f) return 0;
    float c = std::floor(std::floor(t) * 8.0f / extent);
    return static_cast<uint32_t>(std::clamp(c, 0.0f, 7.0f));
}

} // namespace planar
} // namespace ppuview
