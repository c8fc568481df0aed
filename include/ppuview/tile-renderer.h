#pragma once

#include <ppuview/color-table.h>
#include <ppuview/gpu-allocator.h>
#include <ppuview/gpu-context.h>
#include <ppuview/graphics-table.h>
#include <ppuview/result.hpp>
#include <ppuview/shader-uniforms.h>
#include <ppuview/tile-descriptor.h>
#include <webgpu/webgpu.h>
#include <cstddef>
#include <memory>
#include <vector>

namespace ppuview {

/**
 * Tile pipeline: one instance per TileDescriptor, expanded by the vertex
 * stage into a scale*zoom sized quad (4-vertex triangle strip), decoded
 * per fragment from the Graphics Table and resolved through the Color
 * Table. Index 0 pixels are discarded.
 */
class TileRenderer {
public:
    static Result<std::unique_ptr<TileRenderer>> create(const GPUContext& gpu,
                                                        GpuAllocator::Ptr allocator);

    ~TileRenderer();

    TileRenderer(const TileRenderer&) = delete;
    TileRenderer& operator=(const TileRenderer&) = delete;

    // Replace the descriptor stream drawn by render()
    Result<void> setTiles(const std::vector<TileDescriptor>& tiles);
    size_t tileCount() const { return _tileCount; }

    /**
     * Record the draw into an open render pass. The tables must already
     * hold the data for this frame. Uniforms are written to a single
     * buffer, so issue at most one render() per renderer per submit.
     */
    Result<void> render(WGPURenderPassEncoder pass,
                        const GraphicsTable& graphics,
                        const ColorTable& colors,
                        const TileUniforms& uniforms);

    static const char* shaderSource();

private:
    TileRenderer(const GPUContext& gpu, GpuAllocator::Ptr allocator);
    Result<void> init();
    Result<void> ensureInstanceCapacity(size_t tiles);
    Result<void> updateBindGroup(const GraphicsTable& graphics, const ColorTable& colors);

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;

    WGPURenderPipeline _pipeline = nullptr;
    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPUBindGroup _bindGroup = nullptr;
    WGPUBuffer _uniformBuffer = nullptr;
    WGPUBuffer _instanceBuffer = nullptr;

    // Buffers the current bind group was built for
    WGPUBuffer _boundGraphics = nullptr;
    WGPUBuffer _boundColors = nullptr;

    size_t _instanceCapacity = 0;
    size_t _tileCount = 0;
};

} // namespace ppuview
