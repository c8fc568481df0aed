//=============================================================================
// GPU pipelines against the reference rasterizer
//
// Renders headless into an offscreen target, reads back and compares with
// SoftwareRasterizer output. Needs a WebGPU adapter; without one every
// test logs and returns.
//=============================================================================

#include <boost/ut.hpp>

#include "test-data.h"
#include <ppuview/shader-compiler.h>
#include <ppuview/software-rasterizer.h>
#include <ppuview/viewer.h>
#include <ppuview/vram-sheet.h>
#include <ppuview/webgpu-context.h>
#include <ytrace/ytrace.hpp>

#include <cstdlib>
#include <vector>

using namespace boost::ut;
using namespace ppuview;

namespace {

WebGPUContext::Ptr sharedContext() {
    static WebGPUContext::Ptr ctx = [] {
        auto res = WebGPUContext::createHeadless();
        if (!res) {
            ywarn("No WebGPU device, GPU tests skipped: {}", error_msg(res));
            return WebGPUContext::Ptr();
        }
        return *res;
    }();
    return ctx;
}

Viewer::Ptr makeViewer() {
    auto ctx = sharedContext();
    if (!ctx) return nullptr;
    auto res = Viewer::create(ctx);
    expect(res.has_value()) << error_msg(res);
    if (!res) return nullptr;
    return std::move(*res);
}

// Unorm rounding may differ by one step between GPU and CPU
size_t countMismatches(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) return a.size() + b.size();
    size_t mismatches = 0;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::abs(static_cast<int>(a[i]) - static_cast<int>(b[i])) > 1) mismatches++;
    }
    return mismatches;
}

TileUniforms uniformsFor(uint32_t width, uint32_t height, float zoom) {
    TileUniforms u;
    u.screenSize[0] = static_cast<float>(width);
    u.screenSize[1] = static_cast<float>(height);
    u.zoom = zoom;
    return u;
}

const Rgba CLEAR{0.25f, 0.5f, 0.75f, 1.0f};

} // namespace

suite gpu_tile_tests = [] {
    "tile pipeline matches the reference rasterizer"_test = [] {
        auto viewer = makeViewer();
        if (!viewer) return;

        auto vram = testdata::emptyVram();
        testdata::putTile(vram, 0, testdata::gradientTile());
        testdata::putTile(vram, 1, testdata::cornerTile());
        testdata::putTile(vram, 0x600, testdata::gradientTile());
        auto colors = testdata::distinctColors();

        std::vector<TileDescriptor> tiles = {
            {0, 0, 0, TileParams::pack(8, 1, false, false)},
            {8, 0, 1, TileParams::pack(8, 2, true, false)},
            {16, 0, 1, TileParams::pack(16, 3, false, true)},
            {-4, 20, 0x600, TileParams::pack(8, 9, true, true)},
            {4, 4, 1, TileParams::pack(8, 15, false, false)},  // overlaps the first tile
            {40, 40, 7, TileParams::pack(8, 0, false, false)}, // all-zero tile
        };

        for (float zoom : {1.0f, 2.0f}) {
            uint32_t w = 64, h = 64;
            TileUniforms u = uniformsFor(w, h, zoom);

            expect(viewer->loadVram(vram.data(), vram.size()).has_value() >> fatal);
            viewer->setColors(colors);
            auto gpu = viewer->renderTiles(tiles, u, w, h, CLEAR);
            expect(gpu.has_value() >> fatal) << error_msg(gpu);

            Raster cpu(w, h, CLEAR);
            auto res = SoftwareRasterizer::drawTiles(cpu, vram.data(), vram.size(), colors, tiles, u);
            expect(res.has_value() >> fatal);

            expect(countMismatches(*gpu, cpu.toRgba8()) == 0_u) << "zoom" << zoom;
        }
    };

    "end-to-end pixel row resolves to entries 33..47"_test = [] {
        auto viewer = makeViewer();
        if (!viewer) return;

        planar::TileIndices left = {};
        planar::TileIndices right = {};
        for (uint32_t x = 0; x < 8; x++) {
            left[2 * 8 + x] = static_cast<uint8_t>(x + 1);
            right[2 * 8 + x] = static_cast<uint8_t>((x + 9) % 16);
        }
        auto vram = testdata::emptyVram();
        testdata::putTile(vram, 0, left);
        testdata::putTile(vram, 1, right);

        expect(viewer->loadVram(vram.data(), vram.size()).has_value() >> fatal);
        viewer->setColors(testdata::distinctColors());

        std::vector<TileDescriptor> tiles = {
            {0, 0, 0, TileParams::pack(8, 2, false, false)},
            {8, 0, 1, TileParams::pack(8, 2, false, false)},
        };
        Rgba clear{0.0f, 0.0f, 0.0f, 0.0f};
        auto pixels = viewer->renderTiles(tiles, uniformsFor(16, 8, 1.0f), 16, 8, clear);
        expect(pixels.has_value() >> fatal) << error_msg(pixels);

        const uint8_t* row = pixels->data() + 2 * 16 * 4;
        for (uint32_t x = 0; x < 15; x++) {
            expect(row[x * 4] == 33 + x) << "x" << x;
            expect(row[x * 4 + 3] == 255_u) << "x" << x;
        }
        expect(row[15 * 4 + 3] == 0_u);
    };

    "same stream twice is byte-identical"_test = [] {
        auto viewer = makeViewer();
        if (!viewer) return;

        auto vram = testdata::emptyVram();
        for (uint32_t t = 0; t < 64; t++) testdata::putTile(vram, t, testdata::gradientTile());
        expect(viewer->loadVram(vram.data(), vram.size()).has_value() >> fatal);
        viewer->setColors(testdata::distinctColors());

        auto tiles = vram::sheetTiles(8);
        TileUniforms u = uniformsFor(128, 128, 1.0f);
        auto a = viewer->renderTiles(tiles, u, 128, 128, CLEAR);
        auto b = viewer->renderTiles(tiles, u, 128, 128, CLEAR);
        expect(a.has_value() >> fatal);
        expect(b.has_value() >> fatal);
        expect(*a == *b);

        // Tables, renderer buffers, offscreen texture and staging buffer
        expect(viewer->allocator().allocationCount() >= 7_u);
    };

    "oversized VRAM image is rejected"_test = [] {
        auto viewer = makeViewer();
        if (!viewer) return;
        std::vector<uint8_t> big(GRAPHICS_TABLE_BYTES + 1, 0);
        expect(!viewer->loadVram(big.data(), big.size()).has_value());
    };
};

suite gpu_palette_tests = [] {
    "palette pipeline matches the reference rasterizer in every view"_test = [] {
        auto viewer = makeViewer();
        if (!viewer) return;
        auto colors = testdata::distinctColors();
        viewer->setColors(colors);

        for (auto view : {ViewedPalettes::All, ViewedPalettes::BackgroundOnly, ViewedPalettes::SpritesOnly}) {
            uint32_t w = 16 * 8;
            uint32_t h = paletteViewMapping(view).rowCount * 8;
            auto gpu = viewer->renderPalette(view, w, h, CLEAR);
            expect(gpu.has_value() >> fatal) << error_msg(gpu);

            Raster cpu(w, h, CLEAR);
            SoftwareRasterizer::drawPalette(cpu, colors, view);
            expect(countMismatches(*gpu, cpu.toRgba8()) == 0_u) << viewedPalettesName(view);
        }
    };

    "CGRAM upload feeds the palette grid"_test = [] {
        auto viewer = makeViewer();
        if (!viewer) return;

        std::vector<uint8_t> cgram(512, 0);
        cgram[2 * 17] = 0x1F;  // entry 17 = pure red
        expect(viewer->loadCgram(cgram.data(), cgram.size()).has_value() >> fatal);
        expect(!viewer->loadCgram(cgram.data(), 3).has_value());

        auto pixels = viewer->renderPalette(ViewedPalettes::All, 16, 16, CLEAR);
        expect(pixels.has_value() >> fatal);
        const uint8_t* p = pixels->data() + (1 * 16 + 1) * 4;  // column 1, row 1
        expect(p[0] == 255_u);
        expect(p[1] == 0_u);
        expect(p[2] == 0_u);
        expect(p[3] == 255_u);
    };
};

suite gpu_shader_tests = [] {
    "both shaders compile"_test = [] {
        auto ctx = sharedContext();
        if (!ctx) return;
        for (const char* source : {TileRenderer::shaderSource(), PaletteRenderer::shaderSource()}) {
            auto res = compileShaderModule(ctx->getDevice(), "test shader", source);
            expect(res.has_value()) << error_msg(res);
            if (res) wgpuShaderModuleRelease(*res);
        }
    };

    "compile errors are reported, not swallowed"_test = [] {
        auto ctx = sharedContext();
        if (!ctx) return;
        auto res = compileShaderModule(ctx->getDevice(), "broken shader",
                                       "@fragment fn fs_main() -> @location(0) vec4<f32> { return nope; }");
        expect(!res.has_value());
    };

    "allocator tracks and releases renderer resources"_test = [] {
        auto ctx = sharedContext();
        if (!ctx) return;
        auto allocator = std::make_shared<GpuAllocator>(ctx->getDevice());
        {
            auto table = GraphicsTable::create(ctx->gpu(), allocator);
            expect(table.has_value() >> fatal);
            expect(allocator->allocationCount() == 1_u);
            expect(allocator->totalAllocatedBytes() == GRAPHICS_TABLE_BYTES);
        }
        expect(allocator->allocationCount() == 0_u);
        expect(allocator->totalAllocatedBytes() == 0_u);
        expect(allocator->peakAllocatedBytes() == GRAPHICS_TABLE_BYTES);
    };
};

suite gpu_table_tests = [] {
    "each accepted upload bumps the revision once"_test = [] {
        auto ctx = sharedContext();
        if (!ctx) return;
        auto allocator = std::make_shared<GpuAllocator>(ctx->getDevice());

        auto graphics = GraphicsTable::create(ctx->gpu(), allocator);
        expect(graphics.has_value() >> fatal);
        auto& gfx = **graphics;
        expect(gfx.revision() == 0_u);

        auto vram = testdata::emptyVram();
        expect(gfx.upload(vram.data(), vram.size()).has_value());
        expect(gfx.revision() == 1_u);
        expect(gfx.upload(vram.data(), 0).has_value());
        expect(gfx.revision() == 2_u);

        std::vector<uint8_t> big(GRAPHICS_TABLE_BYTES + 1, 0);
        expect(!gfx.upload(big.data(), big.size()).has_value());
        expect(!gfx.upload(nullptr, 16).has_value());
        expect(gfx.revision() == 2_u);

        auto colors = ColorTable::create(ctx->gpu(), allocator);
        expect(colors.has_value() >> fatal);
        auto& cgt = **colors;
        expect(cgt.revision() == 0_u);

        cgt.upload(testdata::distinctColors());
        expect(cgt.revision() == 1_u);

        std::vector<uint8_t> cgram(512, 0);
        expect(cgt.uploadCgram(cgram.data(), cgram.size()).has_value());
        expect(cgt.revision() == 2_u);

        expect(!cgt.uploadCgram(cgram.data(), 3).has_value());
        expect(!cgt.uploadCgram(cgram.data(), 514).has_value());
        expect(!cgt.uploadCgram(nullptr, 2).has_value());
        expect(cgt.revision() == 2_u);
    };
};
