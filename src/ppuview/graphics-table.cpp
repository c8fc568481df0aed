#include <ppuview/graphics-table.h>
#include <ppuview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <cstring>
#include <string>
#include <vector>

namespace ppuview {

Result<GraphicsTable::Ptr> GraphicsTable::create(const GPUContext& gpu, GpuAllocator::Ptr allocator) {
    auto table = Ptr(new GraphicsTable(gpu, std::move(allocator)));
    if (auto res = table->init(); !res) {
        return Err<Ptr>("Failed to init GraphicsTable", res);
    }
    return Ok(std::move(table));
}

GraphicsTable::GraphicsTable(const GPUContext& gpu, GpuAllocator::Ptr allocator)
    : _gpu(gpu), _allocator(std::move(allocator)) {}

GraphicsTable::~GraphicsTable() {
    if (_buffer) _allocator->releaseBuffer(_buffer);
}

Result<void> GraphicsTable::init() {
    if (!_allocator) {
        return Err<void>("GraphicsTable: null allocator");
    }

    WGPUBufferDescriptor desc = {};
    desc.label = WGPU_STR("graphics table");
    desc.size = GRAPHICS_TABLE_BYTES;
    desc.usage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst;
    _buffer = _allocator->createBuffer(desc);
    if (!_buffer) {
        return Err<void>("Failed to create graphics table buffer");
    }
    return Ok();
}

Result<void> GraphicsTable::upload(const uint8_t* data, size_t size) {
    if (size > GRAPHICS_TABLE_BYTES) {
        return Err<void>("graphics image is " + std::to_string(size) +
                         " bytes, table holds " + std::to_string(GRAPHICS_TABLE_BYTES));
    }
    if (size > 0 && !data) {
        return Err<void>("GraphicsTable::upload: null data");
    }

    // Always write the full table so stale tiles never survive a smaller image
    std::vector<uint8_t> image(GRAPHICS_TABLE_BYTES, 0);
    if (size > 0) {
        std::memcpy(image.data(), data, size);
    }
    wgpuQueueWriteBuffer(_gpu.queue, _buffer, 0, image.data(), image.size());

    _revision++;
    ydebug("GraphicsTable: uploaded {} bytes (revision {})", size, _revision);
    return Ok();
}

} // namespace ppuview
