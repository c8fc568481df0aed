#pragma once

// Shared fixtures: hand-built VRAM images and color tables

#include <ppuview/planar.h>
#include <ppuview/snes-color.h>
#include <ppuview/tile-descriptor.h>
#include <cstdint>
#include <vector>

namespace ppuview::testdata {

// 64 KiB VRAM image, all zero
inline std::vector<uint8_t> emptyVram() {
    return std::vector<uint8_t>(GRAPHICS_TABLE_BYTES, 0);
}

inline void putTile(std::vector<uint8_t>& vram, uint32_t tileId, const planar::TileIndices& indices) {
    planar::TileBytes bytes = planar::encodeTile(indices);
    for (size_t i = 0; i < bytes.size(); i++) {
        vram[tileId * TILE_BYTES + i] = bytes[i];
    }
}

// Every pixel gets color index (x + y * 8) % 16
inline planar::TileIndices gradientTile() {
    planar::TileIndices indices = {};
    for (uint32_t i = 0; i < 64; i++) {
        indices[i] = static_cast<uint8_t>(i % 16);
    }
    return indices;
}

// Asymmetric pattern so flips are observable
inline planar::TileIndices cornerTile() {
    planar::TileIndices indices = {};
    indices[0 * 8 + 0] = 1;
    indices[0 * 8 + 1] = 2;
    indices[1 * 8 + 0] = 3;
    indices[7 * 8 + 7] = 15;
    return indices;
}

// Entry i carries its own index in the red channel (i / 255)
inline ColorTableData distinctColors() {
    ColorTableData colors = {};
    for (uint32_t i = 0; i < COLOR_TABLE_SIZE; i++) {
        colors[i] = Rgba{static_cast<float>(i) / 255.0f,
                         static_cast<float>(i % 16) / 15.0f,
                         static_cast<float>(i / 16) / 15.0f,
                         1.0f};
    }
    return colors;
}

inline uint32_t colorIndexOf(const Rgba& c) {
    return static_cast<uint32_t>(c.r * 255.0f + 0.5f);
}

} // namespace ppuview::testdata
