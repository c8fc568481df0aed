#include <ppuview/color-table.h>
#include <ppuview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

namespace ppuview {

Result<ColorTable::Ptr> ColorTable::create(const GPUContext& gpu, GpuAllocator::Ptr allocator) {
    auto table = Ptr(new ColorTable(gpu, std::move(allocator)));
    if (auto res = table->init(); !res) {
        return Err<Ptr>("Failed to init ColorTable", res);
    }
    return Ok(std::move(table));
}

ColorTable::ColorTable(const GPUContext& gpu, GpuAllocator::Ptr allocator)
    : _gpu(gpu), _allocator(std::move(allocator)) {}

ColorTable::~ColorTable() {
    if (_buffer) _allocator->releaseBuffer(_buffer);
}

Result<void> ColorTable::init() {
    if (!_allocator) {
        return Err<void>("ColorTable: null allocator");
    }

    WGPUBufferDescriptor desc = {};
    desc.label = WGPU_STR("color table");
    desc.size = sizeof(ColorTableData);
    desc.usage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst;
    _buffer = _allocator->createBuffer(desc);
    if (!_buffer) {
        return Err<void>("Failed to create color table buffer");
    }
    return Ok();
}

void ColorTable::upload(const ColorTableData& colors) {
    wgpuQueueWriteBuffer(_gpu.queue, _buffer, 0, colors.data(), sizeof(ColorTableData));
    _revision++;
    ydebug("ColorTable: uploaded 256 colors (revision {})", _revision);
}

Result<void> ColorTable::uploadCgram(const uint8_t* data, size_t size) {
    auto colors = colorTableFromCgram(data, size);
    if (!colors) {
        return Err<void>("Failed to convert CGRAM", colors);
    }
    upload(*colors);
    return Ok();
}

} // namespace ppuview
