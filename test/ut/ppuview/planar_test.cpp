//=============================================================================
// Planar tile decode tests
//
// decodePixel must agree with the classic byte-oriented 4bpp rule:
//   plane 0 = byte 2y, plane 1 = byte 2y+1,
//   plane 2 = byte 0x10+2y, plane 3 = byte 0x11+2y, bit 7-x.
//=============================================================================

#include <boost/ut.hpp>

#include "test-data.h"
#include <ppuview/planar.h>

#include <array>
#include <cstdint>
#include <random>

using namespace boost::ut;
using namespace ppuview;

static uint32_t bytewisePixel(const uint8_t* tile, uint32_t x, uint32_t y) {
    uint32_t bit = 7 - x;
    return ((tile[2 * y] >> bit) & 1)
         | (((tile[2 * y + 1] >> bit) & 1) << 1)
         | (((tile[0x10 + 2 * y] >> bit) & 1) << 2)
         | (((tile[0x11 + 2 * y] >> bit) & 1) << 3);
}

suite planar_decode_tests = [] {
    "decodePixel matches the bytewise rule on random tiles"_test = [] {
        std::mt19937 rng(1234);
        for (int round = 0; round < 32; round++) {
            std::array<uint8_t, TILE_BYTES> tile = {};
            for (auto& b : tile) b = static_cast<uint8_t>(rng() & 0xFF);

            planar::TileWords words = planar::loadTile(tile.data(), tile.size(), 0);
            for (uint32_t y = 0; y < 8; y++) {
                for (uint32_t x = 0; x < 8; x++) {
                    expect(planar::decodePixel(words, x, y) == bytewisePixel(tile.data(), x, y))
                        << "round" << round << "x" << x << "y" << y;
                }
            }
        }
    };

    "single set bit lands on the expected pixel and plane"_test = [] {
        // Byte 0x12 = plane 2 of row 1; bit 0x20 = column 2
        std::array<uint8_t, TILE_BYTES> tile = {};
        tile[0x12] = 0x20;
        planar::TileIndices indices = planar::decodeTile(planar::loadTile(tile.data(), tile.size(), 0));
        for (uint32_t i = 0; i < 64; i++) {
            uint32_t expected = (i == 1 * 8 + 2) ? 4u : 0u;
            expect(indices[i] == expected) << "pixel" << i;
        }
    };

    "encodeTile inverts decodeTile"_test = [] {
        planar::TileIndices indices = testdata::gradientTile();
        planar::TileBytes bytes = planar::encodeTile(indices);
        planar::TileIndices decoded = planar::decodeTile(planar::loadTile(bytes.data(), bytes.size(), 0));
        expect(decoded == indices);
    };

    "encodeTile masks indices to four bits"_test = [] {
        planar::TileIndices indices = {};
        indices[0] = 0x13;
        planar::TileBytes bytes = planar::encodeTile(indices);
        planar::TileIndices decoded = planar::decodeTile(planar::loadTile(bytes.data(), bytes.size(), 0));
        expect(decoded[0] == 3_u);
    };

    "loadTile addresses records tileId*2 and tileId*2+1"_test = [] {
        auto vram = testdata::emptyVram();
        testdata::putTile(vram, 5, testdata::cornerTile());

        planar::TileWords words = planar::loadTile(vram.data(), vram.size(), 5);
        expect(planar::decodeTile(words) == testdata::cornerTile());

        planar::TileWords other = planar::loadTile(vram.data(), vram.size(), 4);
        expect(planar::decodeTile(other) == planar::TileIndices{});
    };

    "loadTile zero-fills past the end of a short image"_test = [] {
        std::array<uint8_t, 20> shortImage;
        shortImage.fill(0xFF);
        planar::TileWords words = planar::loadTile(shortImage.data(), shortImage.size(), 0);
        expect(words[4] == 0xFFFFFFFF_u);
        expect(words[5] == 0_u);
        expect(words[7] == 0_u);

        planar::TileWords beyond = planar::loadTile(shortImage.data(), shortImage.size(), 3);
        for (uint32_t w : beyond) expect(w == 0_u);
    };
};

suite planar_coordinate_tests = [] {
    "intraTileCoord maps scale*zoom pixels onto 8 cells"_test = [] {
        // scale 8, zoom 1: one texel per pixel
        for (uint32_t i = 0; i < 8; i++) {
            expect(planar::intraTileCoord(static_cast<float>(i) + 0.5f, 8, 1.0f) == i);
        }
        // scale 8, zoom 2: two pixels per texel
        expect(planar::intraTileCoord(0.5f, 8, 2.0f) == 0_u);
        expect(planar::intraTileCoord(1.5f, 8, 2.0f) == 0_u);
        expect(planar::intraTileCoord(2.5f, 8, 2.0f) == 1_u);
        expect(planar::intraTileCoord(15.5f, 8, 2.0f) == 7_u);
        // scale 16, zoom 1: tile drawn at double size
        expect(planar::intraTileCoord(3.5f, 16, 1.0f) == 1_u);
    };

    "intraTileCoord clamps to the tile"_test = [] {
        expect(planar::intraTileCoord(-3.0f, 8, 1.0f) == 0_u);
        expect(planar::intraTileCoord(8.0f, 8, 1.0f) == 7_u);
        expect(planar::intraTileCoord(100.0f, 8, 1.0f) == 7_u);
    };

    "intraTileCoord tolerates an empty extent"_test = [] {
        expect(planar::intraTileCoord(1.0f, 0, 1.0f) == 0_u);
        expect(planar::intraTileCoord(1.0f, 8, 0.0f) == 0_u);
    };

    "paletteIndex stays inside its row for non-zero indices"_test = [] {
        for (uint32_t row = 0; row < PALETTE_ROWS; row++) {
            for (uint32_t ci = 1; ci < 16; ci++) {
                uint32_t idx = planar::paletteIndex(ci, row);
                expect(idx >= row * 16 + 1 && idx <= row * 16 + 15) << "row" << row << "ci" << ci;
            }
        }
    };
};
