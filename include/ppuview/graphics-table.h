#pragma once

#include <ppuview/gpu-allocator.h>
#include <ppuview/gpu-context.h>
#include <ppuview/result.hpp>
#include <ppuview/tile-descriptor.h>
#include <webgpu/webgpu.h>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace ppuview {

/**
 * GPU-resident Graphics Table: 4096 x 128-bit records of planar tile data
 * (a full VRAM image), bound read-only to the tile pipeline.
 *
 * Allocated once; the host replaces the whole contents with upload()
 * before any draw that depends on changed data.
 */
class GraphicsTable {
public:
    using Ptr = std::shared_ptr<GraphicsTable>;

    static Result<Ptr> create(const GPUContext& gpu, GpuAllocator::Ptr allocator);

    ~GraphicsTable();

    GraphicsTable(const GraphicsTable&) = delete;
    GraphicsTable& operator=(const GraphicsTable&) = delete;

    /**
     * Replace the table contents. Shorter images are zero-padded to the
     * full 64 KiB; longer ones are rejected.
     */
    Result<void> upload(const uint8_t* data, size_t size);

    WGPUBuffer buffer() const { return _buffer; }
    uint64_t byteSize() const { return GRAPHICS_TABLE_BYTES; }
    uint64_t revision() const { return _revision; }

private:
    GraphicsTable(const GPUContext& gpu, GpuAllocator::Ptr allocator);
    Result<void> init();

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;
    WGPUBuffer _buffer = nullptr;
    uint64_t _revision = 0;
};

} // namespace ppuview
