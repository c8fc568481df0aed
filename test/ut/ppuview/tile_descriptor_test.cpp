//=============================================================================
// TileDescriptor packing and helpers
//=============================================================================

#include <boost/ut.hpp>

#include <ppuview/tile-descriptor.h>

#include <cstddef>
#include <cstring>
#include <limits>

using namespace boost::ut;
using namespace ppuview;

suite tile_descriptor_tests = [] {
    "descriptor is four packed 32-bit words"_test = [] {
        expect(sizeof(TileDescriptor) == 16_u);
        expect(offsetof(TileDescriptor, x) == 0_u);
        expect(offsetof(TileDescriptor, y) == 4_u);
        expect(offsetof(TileDescriptor, tileId) == 8_u);
        expect(offsetof(TileDescriptor, params) == 12_u);
    };

    "params bit layout"_test = [] {
        uint32_t p = TileParams::pack(8, 3, false, false);
        expect(p == 0x0308_u);
        expect(TileParams::pack(16, 15, true, false) == 0x4F10_u);
        expect(TileParams::pack(255, 0, false, true) == 0x80FF_u);
        expect(TileParams::pack(8, 2, true, true) == 0xC208_u);

        uint32_t q = TileParams::pack(200, 9, true, true);
        expect(TileParams::scale(q) == 200_u);
        expect(TileParams::colorRow(q) == 9_u);
        expect(TileParams::flipX(q));
        expect(TileParams::flipY(q));
    };

    "negative anchors keep their bit pattern"_test = [] {
        auto res = TileDescriptor::make(-8, -16, 1, 8, 0);
        expect(res.has_value() >> fatal);
        uint32_t raw[4];
        std::memcpy(raw, &*res, sizeof(raw));
        expect(raw[0] == 0xFFFFFFF8_u);
        expect(raw[1] == 0xFFFFFFF0_u);
    };

    "make validates table addressing"_test = [] {
        expect(TileDescriptor::make(0, 0, MAX_TILES - 1, 8, 15).has_value());
        expect(!TileDescriptor::make(0, 0, MAX_TILES, 8, 0).has_value());
        expect(!TileDescriptor::make(0, 0, 0, 8, 16).has_value());
        expect(!TileDescriptor::make(0, 0, 0, 256, 0).has_value());

        auto err = TileDescriptor::make(0, 0, 5000, 8, 0);
        expect(!err.has_value() >> fatal);
        expect(err.error().message().find("5000") != std::string::npos);
    };

    "make accepts a zero scale"_test = [] {
        auto res = TileDescriptor::make(0, 0, 0, 0, 0);
        expect(res.has_value() >> fatal);
        expect(res->scale() == 0_u);
    };

    "background tilemap entry"_test = [] {
        // vhopppcc cccccccc: flip y, palette 5, tile 0x2AB
        TileDescriptor d = TileDescriptor::fromBackgroundEntry(16, 24, 0x96AB);
        expect(d.x == 16_i);
        expect(d.y == 24_i);
        expect(d.tileId == 0x2AB_u);
        expect(d.colorRow() == 5_u);
        expect(d.scale() == 8_u);
        expect(d.flipY());
        expect(!d.flipX());
    };

    "sprite entry uses the upper VRAM half and rows 8-15"_test = [] {
        TileDescriptor d = TileDescriptor::fromSpriteEntry(0, 0, 0x4E05);
        expect(d.tileId == 0x605_u);
        expect(d.colorRow() == 15_u);
        expect(d.flipX());
        expect(!d.flipY());

        TileDescriptor first = TileDescriptor::fromSpriteEntry(0, 0, 0);
        expect(first.tileId == 0x600_u);
        expect(first.colorRow() == 8_u);
    };

    "moveBy shifts the anchor"_test = [] {
        TileDescriptor d{4, 4, 1, TileParams::pack(8, 0, false, false)};
        d.moveBy(-10, 3);
        expect(d.x == -6);
        expect(d.y == 7_i);
        expect(d.tileId == 1_u);
    };

    "moveBy wraps at the coordinate limits"_test = [] {
        TileDescriptor d{std::numeric_limits<int32_t>::max(), std::numeric_limits<int32_t>::min(), 0, 0};
        d.moveBy(1, -1);
        expect(d.x == std::numeric_limits<int32_t>::min());
        expect(d.y == std::numeric_limits<int32_t>::max());
    };

    "snapToGrid floors onto the cell grid"_test = [] {
        TileDescriptor d{13, 21, 0, 0};
        d.snapToGrid(8, 0.0f, 0.0f);
        expect(d.x == 8_i);
        expect(d.y == 16_i);

        TileDescriptor e{13, 21, 0, 0};
        e.snapToGrid(8, 4.0f, 4.0f);
        expect(e.x == 16_i);
        expect(e.y == 24_i);

        TileDescriptor n{-3, 5, 0, 0};
        n.snapToGrid(8, 0.0f, 0.0f);
        expect(n.x == -8);
        expect(n.y == 0_i);

        TileDescriptor z{5, 5, 0, 0};
        z.snapToGrid(0, 0.0f, 0.0f);
        expect(z.x == 5_i);
    };
};
