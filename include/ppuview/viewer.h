#pragma once

#include <ppuview/color-table.h>
#include <ppuview/gpu-allocator.h>
#include <ppuview/graphics-table.h>
#include <ppuview/offscreen-target.h>
#include <ppuview/palette-renderer.h>
#include <ppuview/result.hpp>
#include <ppuview/tile-renderer.h>
#include <ppuview/webgpu-context.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace ppuview {

/**
 * Both pipelines plus their shared tables on one headless device. Each
 * render call draws a single pass into an offscreen target of the
 * requested size and returns the RGBA8 pixels.
 */
class Viewer {
public:
    using Ptr = std::unique_ptr<Viewer>;

    static Result<Ptr> create(WebGPUContext::Ptr context);

    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    Result<void> loadVram(const uint8_t* data, size_t size);
    Result<void> loadCgram(const uint8_t* data, size_t size);
    void setColors(const ColorTableData& colors);

    Result<std::vector<uint8_t>> renderTiles(const std::vector<TileDescriptor>& tiles,
                                             const TileUniforms& uniforms,
                                             uint32_t width, uint32_t height,
                                             const Rgba& clear);

    Result<std::vector<uint8_t>> renderPalette(ViewedPalettes view,
                                               uint32_t width, uint32_t height,
                                               const Rgba& clear);

    const GpuAllocator& allocator() const { return *_allocator; }

private:
    explicit Viewer(WebGPUContext::Ptr context);
    Result<void> init();
    Result<OffscreenTarget*> targetFor(uint32_t width, uint32_t height);
    Result<std::vector<uint8_t>> finish();

    WebGPUContext::Ptr _context;
    GpuAllocator::Ptr _allocator;
    GraphicsTable::Ptr _graphics;
    ColorTable::Ptr _colors;
    std::unique_ptr<TileRenderer> _tileRenderer;
    std::unique_ptr<PaletteRenderer> _paletteRenderer;
    OffscreenTarget::Ptr _target;
};

} // namespace ppuview
