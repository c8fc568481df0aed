#include <ppuview/offscreen-target.h>
#include <ppuview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <cstring>
#include <string>

namespace ppuview {

constexpr uint32_t BYTES_PER_TEXEL = 4;
constexpr uint32_t COPY_ROW_ALIGNMENT = 256;

uint32_t OffscreenTarget::paddedBytesPerRow(uint32_t width) {
    uint32_t tight = width * BYTES_PER_TEXEL;
    return (tight + COPY_ROW_ALIGNMENT - 1) / COPY_ROW_ALIGNMENT * COPY_ROW_ALIGNMENT;
}

Result<OffscreenTarget::Ptr> OffscreenTarget::create(const GPUContext& gpu,
                                                     GpuAllocator::Ptr allocator,
                                                     uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return Err<Ptr>("OffscreenTarget: empty size " + std::to_string(width) + "x" +
                        std::to_string(height));
    }
    auto target = Ptr(new OffscreenTarget(gpu, std::move(allocator), width, height));
    if (auto res = target->init(); !res) {
        return Err<Ptr>("Failed to init OffscreenTarget", res);
    }
    return Ok(std::move(target));
}

OffscreenTarget::OffscreenTarget(const GPUContext& gpu, GpuAllocator::Ptr allocator,
                                 uint32_t width, uint32_t height)
    : _gpu(gpu), _allocator(std::move(allocator)), _width(width), _height(height) {}

OffscreenTarget::~OffscreenTarget() {
    if (_view) wgpuTextureViewRelease(_view);
    if (_allocator) {
        _allocator->releaseTexture(_texture);
        _allocator->releaseBuffer(_staging);
    }
}

Result<void> OffscreenTarget::init() {
    if (!_allocator) {
        return Err<void>("OffscreenTarget: null allocator");
    }

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("offscreen target");
    texDesc.size = {_width, _height, 1};
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = _gpu.targetFormat;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_CopySrc;
    _texture = _allocator->createTexture(texDesc);
    if (!_texture) {
        return Err<void>("Failed to create offscreen texture");
    }

    _view = wgpuTextureCreateView(_texture, nullptr);
    if (!_view) {
        return Err<void>("Failed to create offscreen texture view");
    }

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("offscreen staging");
    bufDesc.size = static_cast<uint64_t>(paddedBytesPerRow(_width)) * _height;
    bufDesc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
    _staging = _allocator->createBuffer(bufDesc);
    if (!_staging) {
        return Err<void>("Failed to create offscreen staging buffer");
    }

    ydebug("OffscreenTarget: {}x{}", _width, _height);
    return Ok();
}

Result<void> OffscreenTarget::renderFrame(const DrawFn& draw, const Rgba& clear) {
    WGPUCommandEncoderDescriptor encDesc = {};
    encDesc.label = WGPU_STR("offscreen frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_gpu.device, &encDesc);
    if (!encoder) {
        return Err<void>("Failed to create command encoder");
    }

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = _view;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    WGPU_COLOR_ATTACHMENT_CLEAR(colorAttachment, clear.r, clear.g, clear.b, clear.a);

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    if (!pass) {
        wgpuCommandEncoderRelease(encoder);
        return Err<void>("Failed to begin offscreen render pass");
    }

    Result<void> drawRes = draw ? draw(pass) : Ok();
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
    if (!drawRes) {
        wgpuCommandEncoderRelease(encoder);
        return Err<void>("Offscreen draw failed", drawRes);
    }

    WGPUTexelCopyTextureInfo src = {};
    src.texture = _texture;
    src.mipLevel = 0;
    src.origin = {0, 0, 0};
    src.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferInfo dst = {};
    dst.buffer = _staging;
    dst.layout.offset = 0;
    dst.layout.bytesPerRow = paddedBytesPerRow(_width);
    dst.layout.rowsPerImage = _height;

    WGPUExtent3D extent = {_width, _height, 1};
    wgpuCommandEncoderCopyTextureToBuffer(encoder, &src, &dst, &extent);

    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuCommandEncoderRelease(encoder);
    if (!cmdBuf) {
        return Err<void>("Failed to finish offscreen command buffer");
    }
    wgpuQueueSubmit(_gpu.queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);

    _hasFrame = true;
    return Ok();
}

Result<std::vector<uint8_t>> OffscreenTarget::readback() {
    if (!_hasFrame) {
        return Err<std::vector<uint8_t>>("OffscreenTarget::readback: nothing rendered yet");
    }

    struct MapResult {
        bool done = false;
        WGPUMapAsyncStatus status = WGPUMapAsyncStatus_Success;
    } map;

    uint32_t padded = paddedBytesPerRow(_width);
    uint64_t size = static_cast<uint64_t>(padded) * _height;

    WGPUBufferMapCallbackInfo mapCb = {};
    mapCb.mode = WGPUCallbackMode_AllowSpontaneous;
    mapCb.callback = [](WGPUMapAsyncStatus status, WGPUStringView, void* ud, void*) {
        auto* m = static_cast<MapResult*>(ud);
        m->status = status;
        m->done = true;
    };
    mapCb.userdata1 = &map;
    wgpuBufferMapAsync(_staging, WGPUMapMode_Read, 0, size, mapCb);
    while (!map.done) WGPU_DEVICE_TICK(_gpu.device);

    if (map.status != WGPUMapAsyncStatus_Success) {
        return Err<std::vector<uint8_t>>("Failed to map offscreen staging buffer (status " +
                                         std::to_string(static_cast<int>(map.status)) + ")");
    }

    const auto* mapped = static_cast<const uint8_t*>(
        wgpuBufferGetConstMappedRange(_staging, 0, size));
    if (!mapped) {
        wgpuBufferUnmap(_staging);
        return Err<std::vector<uint8_t>>("Offscreen staging buffer has no mapped range");
    }

    uint32_t tight = _width * BYTES_PER_TEXEL;
    std::vector<uint8_t> pixels(static_cast<size_t>(tight) * _height);
    for (uint32_t y = 0; y < _height; y++) {
        std::memcpy(pixels.data() + static_cast<size_t>(y) * tight,
                    mapped + static_cast<size_t>(y) * padded, tight);
    }
    wgpuBufferUnmap(_staging);
    return Ok(std::move(pixels));
}

} // namespace ppuview
