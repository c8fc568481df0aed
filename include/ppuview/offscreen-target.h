#pragma once

#include <ppuview/gpu-allocator.h>
#include <ppuview/gpu-context.h>
#include <ppuview/result.hpp>
#include <ppuview/snes-color.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace ppuview {

/**
 * Render target without a surface: an RGBA8 texture plus a mappable
 * staging buffer. Used by ppuview-render and the GPU tests to get the
 * pipelines' output back on the host.
 */
class OffscreenTarget {
public:
    using Ptr = std::unique_ptr<OffscreenTarget>;
    using DrawFn = std::function<Result<void>(WGPURenderPassEncoder pass)>;

    static Result<Ptr> create(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                              uint32_t width, uint32_t height);

    ~OffscreenTarget();

    OffscreenTarget(const OffscreenTarget&) = delete;
    OffscreenTarget& operator=(const OffscreenTarget&) = delete;

    // Clear, let `draw` record into the pass, copy to staging and submit
    Result<void> renderFrame(const DrawFn& draw, const Rgba& clear);

    // Tightly packed RGBA8 rows of the last rendered frame
    Result<std::vector<uint8_t>> readback();

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    // Copies need 256-byte aligned rows
    static uint32_t paddedBytesPerRow(uint32_t width);

private:
    OffscreenTarget(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                    uint32_t width, uint32_t height);
    Result<void> init();

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;
    uint32_t _width;
    uint32_t _height;

    WGPUTexture _texture = nullptr;
    WGPUTextureView _view = nullptr;
    WGPUBuffer _staging = nullptr;
    bool _hasFrame = false;
};

} // namespace ppuview
