#include <ppuview/viewer.h>
#include <ytrace/ytrace.hpp>

namespace ppuview {

Result<Viewer::Ptr> Viewer::create(WebGPUContext::Ptr context) {
    if (!context) {
        return Err<Ptr>("Viewer: null WebGPU context");
    }
    auto viewer = Ptr(new Viewer(std::move(context)));
    if (auto res = viewer->init(); !res) {
        return Err<Ptr>("Failed to init Viewer", res);
    }
    return Ok(std::move(viewer));
}

Viewer::Viewer(WebGPUContext::Ptr context) : _context(std::move(context)) {}

Viewer::~Viewer() {
    // GPU objects go before the allocator report
    _target.reset();
    _paletteRenderer.reset();
    _tileRenderer.reset();
    _colors.reset();
    _graphics.reset();
    if (_allocator && _allocator->allocationCount() > 0) {
        _allocator->dumpAllocations();
    }
}

Result<void> Viewer::init() {
    GPUContext gpu = _context->gpu();
    _allocator = std::make_shared<GpuAllocator>(gpu.device);

    auto graphicsRes = GraphicsTable::create(gpu, _allocator);
    if (!graphicsRes) {
        return Err<void>("Failed to create graphics table", graphicsRes);
    }
    _graphics = *graphicsRes;

    auto colorsRes = ColorTable::create(gpu, _allocator);
    if (!colorsRes) {
        return Err<void>("Failed to create color table", colorsRes);
    }
    _colors = *colorsRes;

    auto tileRes = TileRenderer::create(gpu, _allocator);
    if (!tileRes) {
        return Err<void>("Failed to create tile renderer", tileRes);
    }
    _tileRenderer = std::move(*tileRes);

    auto paletteRes = PaletteRenderer::create(gpu, _allocator);
    if (!paletteRes) {
        return Err<void>("Failed to create palette renderer", paletteRes);
    }
    _paletteRenderer = std::move(*paletteRes);

    yinfo("Viewer ready: {} GPU allocations, {} bytes",
          _allocator->allocationCount(), _allocator->totalAllocatedBytes());
    return Ok();
}

Result<void> Viewer::loadVram(const uint8_t* data, size_t size) {
    return _graphics->upload(data, size);
}

Result<void> Viewer::loadCgram(const uint8_t* data, size_t size) {
    return _colors->uploadCgram(data, size);
}

void Viewer::setColors(const ColorTableData& colors) {
    _colors->upload(colors);
}

Result<OffscreenTarget*> Viewer::targetFor(uint32_t width, uint32_t height) {
    if (_target && _target->width() == width && _target->height() == height) {
        return Ok(_target.get());
    }
    _target.reset();
    auto res = OffscreenTarget::create(_context->gpu(), _allocator, width, height);
    if (!res) {
        return Err<OffscreenTarget*>("Failed to create offscreen target", res);
    }
    _target = std::move(*res);
    return Ok(_target.get());
}

Result<std::vector<uint8_t>> Viewer::finish() {
    if (auto res = _context->waitIdle(); !res) {
        return Err<std::vector<uint8_t>>("GPU work did not finish", res);
    }
    return _target->readback();
}

Result<std::vector<uint8_t>> Viewer::renderTiles(const std::vector<TileDescriptor>& tiles,
                                                 const TileUniforms& uniforms,
                                                 uint32_t width, uint32_t height,
                                                 const Rgba& clear) {
    auto targetRes = targetFor(width, height);
    if (!targetRes) {
        return Err<std::vector<uint8_t>>("Viewer::renderTiles", targetRes);
    }
    if (auto res = _tileRenderer->setTiles(tiles); !res) {
        return Err<std::vector<uint8_t>>("Viewer::renderTiles", res);
    }

    auto frameRes = (*targetRes)->renderFrame([&](WGPURenderPassEncoder pass) {
        return _tileRenderer->render(pass, *_graphics, *_colors, uniforms);
    }, clear);
    if (!frameRes) {
        return Err<std::vector<uint8_t>>("Viewer::renderTiles", frameRes);
    }
    return finish();
}

Result<std::vector<uint8_t>> Viewer::renderPalette(ViewedPalettes view,
                                                   uint32_t width, uint32_t height,
                                                   const Rgba& clear) {
    auto targetRes = targetFor(width, height);
    if (!targetRes) {
        return Err<std::vector<uint8_t>>("Viewer::renderPalette", targetRes);
    }

    auto frameRes = (*targetRes)->renderFrame([&](WGPURenderPassEncoder pass) {
        return _paletteRenderer->render(pass, *_colors, view);
    }, clear);
    if (!frameRes) {
        return Err<std::vector<uint8_t>>("Viewer::renderPalette", frameRes);
    }
    return finish();
}

} // namespace ppuview
