#pragma once

#include <ppuview/palette-view.h>
#include <ppuview/result.hpp>
#include <ppuview/shader-uniforms.h>
#include <ppuview/snes-color.h>
#include <ppuview/tile-descriptor.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ppuview {

// RGBA float image plus a mask of the pixels any fragment wrote
class Raster {
public:
    Raster(uint32_t width, uint32_t height, const Rgba& clear = {});

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    const Rgba& pixel(uint32_t x, uint32_t y) const { return _pixels[index(x, y)]; }
    bool written(uint32_t x, uint32_t y) const { return _written[index(x, y)] != 0; }
    void write(uint32_t x, uint32_t y, const Rgba& color);

    size_t writtenCount() const;

    // Unorm conversion as done by an RGBA8Unorm render target
    std::vector<uint8_t> toRgba8() const;

    bool operator==(const Raster&) const = default;

private:
    size_t index(uint32_t x, uint32_t y) const { return static_cast<size_t>(y) * _width + x; }

    uint32_t _width;
    uint32_t _height;
    std::vector<Rgba> _pixels;
    std::vector<uint8_t> _written;
};

/**
 * CPU rendition of the tile and palette pipelines. Fragments are sampled
 * at pixel centers with a top-left fill rule, instances are processed in
 * order and later fragments overwrite earlier ones, exactly like a draw
 * without blending.
 */
class SoftwareRasterizer {
public:
    /**
     * gfx/gfxSize is the Graphics Table image; reads past its end see
     * zero records, like the zero-padded GPU table.
     */
    static Result<void> drawTiles(Raster& target,
                                  const uint8_t* gfx, size_t gfxSize,
                                  const ColorTableData& colors,
                                  const std::vector<TileDescriptor>& tiles,
                                  const TileUniforms& uniforms);

    static void drawPalette(Raster& target,
                            const ColorTableData& colors,
                            ViewedPalettes view);

    // Palette grid cell (column, row) sampled at pixel (x, y), before discard
    static void paletteCell(uint32_t x, uint32_t y, uint32_t width, uint32_t height,
                            ViewedPalettes view, uint32_t& column, uint32_t& row);
};

} // namespace ppuview
