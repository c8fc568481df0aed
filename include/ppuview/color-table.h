#pragma once

#include <ppuview/gpu-allocator.h>
#include <ppuview/gpu-context.h>
#include <ppuview/result.hpp>
#include <ppuview/snes-color.h>
#include <webgpu/webgpu.h>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace ppuview {

/**
 * GPU-resident Color Table: 256 RGBA entries, 16 palette rows of 16
 * columns, addressed as row*16 + column. Shared by both pipelines.
 */
class ColorTable {
public:
    using Ptr = std::shared_ptr<ColorTable>;

    static Result<Ptr> create(const GPUContext& gpu, GpuAllocator::Ptr allocator);

    ~ColorTable();

    ColorTable(const ColorTable&) = delete;
    ColorTable& operator=(const ColorTable&) = delete;

    void upload(const ColorTableData& colors);

    // Raw CGRAM (little-endian BGR555), up to 512 bytes
    Result<void> uploadCgram(const uint8_t* data, size_t size);

    WGPUBuffer buffer() const { return _buffer; }
    uint64_t byteSize() const { return sizeof(ColorTableData); }
    uint64_t revision() const { return _revision; }

private:
    ColorTable(const GPUContext& gpu, GpuAllocator::Ptr allocator);
    Result<void> init();

    GPUContext _gpu;
    GpuAllocator::Ptr _allocator;
    WGPUBuffer _buffer = nullptr;
    uint64_t _revision = 0;
};

} // namespace ppuview
