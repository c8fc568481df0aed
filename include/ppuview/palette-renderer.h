#pragma once

#include <ppuview/color-table.h>
#include <ppuview/gpu-allocator.h>
#include <ppuview/gpu-context.h>
#include <ppuview/palette-view.h>
#include <ppuview/result.hpp>
#include <ppuview/shader-uniforms.h>
#include <webgpu/webgpu.h>
#include <memory>

namespace ppuview {

/**
 * Palette pipeline: one full-viewport quad showing the Color Table as a
 * 16-column grid. The view mode is resolved on the host into a vertical
 * texture range, so the fragment stage never branches on it. Column 0 of
 * every row is discarded.
 */
class PaletteRenderer {
public:
    static Result<std::unique_ptr<PaletteRenderer>> create(const GPUContext& gpu,
                                                           GpuAllocator::Ptr allocator);

    ~PaletteRenderer();

    PaletteRenderer(const PaletteRenderer&) = delete;
    PaletteRenderer& operator=(const PaletteRenderer&) = delete;

    // Record the grid draw into an open render pass. The view is written
    // to a single uniform buffer, so issue at most one render() per
    // renderer per submit.
    Result<void> render(WGPURenderPassEncoder pass,
                        const ColorTable& colors,
                        ViewedPalettes view);

    static PaletteUniforms uniformsFor(ViewedPalettes view);
    static const char* shaderSource();

private:
    PaletteRenderer(const GPUContext& gpu, GpuAllocator::Ptr allocator);
    Result<void> init();

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;

    WGPURenderPipeline _pipeline = nullptr;
    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPUBindGroup _bindGroup = nullptr;
    WGPUBuffer _uniformBuffer = nullptr;
    WGPUBuffer _boundColors = nullptr;
};

} // namespace ppuview
