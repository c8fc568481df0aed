#include <ppuview/software-rasterizer.h>
#include <ppuview/planar.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace ppuview {

//-----------------------------------------------------------------------------
// Raster
//-----------------------------------------------------------------------------

Raster::Raster(uint32_t width, uint32_t height, const Rgba& clear)
    : _width(width), _height(height),
      _pixels(static_cast<size_t>(width) * height, clear),
      _written(static_cast<size_t>(width) * height, 0) {}

void Raster::write(uint32_t x, uint32_t y, const Rgba& color) {
    size_t i = index(x, y);
    _pixels[i] = color;
    _written[i] = 1;
}

size_t Raster::writtenCount() const {
    return static_cast<size_t>(std::count(_written.begin(), _written.end(), uint8_t{1}));
}

std::vector<uint8_t> Raster::toRgba8() const {
    auto unorm = [](float c) {
        return static_cast<uint8_t>(std::lround(std::clamp(c, 0.0f, 1.0f) * 255.0f));
    };
    std::vector<uint8_t> out;
    out.reserve(_pixels.size() * 4);
    for (const Rgba& p : _pixels) {
        out.push_back(unorm(p.r));
        out.push_back(unorm(p.g));
        out.push_back(unorm(p.b));
        out.push_back(unorm(p.a));
    }
    return out;
}

//-----------------------------------------------------------------------------
// Tile pipeline
//-----------------------------------------------------------------------------

// Pixels whose centers fall in [lo, hi): left/top edges in, right/bottom out
static void coveredSpan(float lo, float hi, uint32_t limit, int64_t& first, int64_t& last) {
    first = static_cast<int64_t>(std::ceil(lo - 0.5f));
    last = static_cast<int64_t>(std::ceil(hi - 0.5f)) - 1;
    first = std::max<int64_t>(first, 0);
    last = std::min<int64_t>(last, static_cast<int64_t>(limit) - 1);
}

Result<void> SoftwareRasterizer::drawTiles(Raster& target,
                                           const uint8_t* gfx, size_t gfxSize,
                                           const ColorTableData& colors,
                                           const std::vector<TileDescriptor>& tiles,
                                           const TileUniforms& uniforms) {
    if (uniforms.screenSize[0] <= 0.0f || uniforms.screenSize[1] <= 0.0f) {
        return Err<void>("SoftwareRasterizer::drawTiles: empty screen size");
    }
    if (gfxSize > GRAPHICS_TABLE_BYTES) {
        return Err<void>("SoftwareRasterizer::drawTiles: graphics image exceeds the table");
    }

    // The viewport maps screenSize onto the target; tools keep them equal
    float sx = static_cast<float>(target.width()) / uniforms.screenSize[0];
    float sy = static_cast<float>(target.height()) / uniforms.screenSize[1];
    float zoom = uniforms.zoom;

    for (const TileDescriptor& tile : tiles) {
        uint32_t scale = tile.scale();
        float extent = static_cast<float>(scale) * zoom;
        if (extent <= 0.0f) continue;

        float x0 = (static_cast<float>(tile.x) + uniforms.offset[0]) * zoom;
        float y0 = (static_cast<float>(tile.y) + uniforms.offset[1]) * zoom;

        int64_t px0, px1, py0, py1;
        coveredSpan(x0 * sx, (x0 + extent) * sx, target.width(), px0, px1);
        coveredSpan(y0 * sy, (y0 + extent) * sy, target.height(), py0, py1);
        if (px0 > px1 || py0 > py1) continue;

        planar::TileWords words = planar::loadTile(gfx, gfxSize, tile.tileId);
        uint32_t row = tile.colorRow();

        for (int64_t py = py0; py <= py1; py++) {
            float ty = (static_cast<float>(py) + 0.5f) / sy - y0;
            uint32_t iy = planar::intraTileCoord(ty, scale, zoom);
            if (tile.flipY()) iy = 7 - iy;

            for (int64_t px = px0; px <= px1; px++) {
                float tx = (static_cast<float>(px) + 0.5f) / sx - x0;
                uint32_t ix = planar::intraTileCoord(tx, scale, zoom);
                if (tile.flipX()) ix = 7 - ix;

                uint32_t ci = planar::decodePixel(words, ix, iy);
                if (ci == 0) continue;
                target.write(static_cast<uint32_t>(px), static_cast<uint32_t>(py),
                             colors[planar::paletteIndex(ci, row)]);
            }
        }
    }

    ydebug("SoftwareRasterizer: {} tiles into {}x{}", tiles.size(), target.width(), target.height());
    return Ok();
}

//-----------------------------------------------------------------------------
// Palette pipeline
//-----------------------------------------------------------------------------

void SoftwareRasterizer::paletteCell(uint32_t x, uint32_t y, uint32_t width, uint32_t height,
                                     ViewedPalettes view, uint32_t& column, uint32_t& row) {
    PaletteViewMapping mapping = paletteViewMapping(view);
    float u = (static_cast<float>(x) + 0.5f) / static_cast<float>(width);
    float t = (static_cast<float>(y) + 0.5f) / static_cast<float>(height);
    float v = mapping.v0 + (mapping.v1 - mapping.v0) * t;

    column = std::min(static_cast<uint32_t>(std::floor(u * PALETTE_COLUMNS)), PALETTE_COLUMNS - 1);
    row = std::min(static_cast<uint32_t>(std::floor(v * PALETTE_ROWS)), PALETTE_ROWS - 1);
}

void SoftwareRasterizer::drawPalette(Raster& target,
                                     const ColorTableData& colors,
                                     ViewedPalettes view) {
    for (uint32_t y = 0; y < target.height(); y++) {
        for (uint32_t x = 0; x < target.width(); x++) {
            uint32_t column, row;
            paletteCell(x, y, target.width(), target.height(), view, column, row);
            if (column == 0) continue;
            target.write(x, y, colors[planar::paletteIndex(column, row)]);
        }
    }
}

} // namespace ppuview
