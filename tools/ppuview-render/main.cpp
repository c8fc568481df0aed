// ppuview-render - render a VRAM tile sheet or a CGRAM palette grid to PNG

#include <ppuview/config.h>
#include <ppuview/file-io.h>
#include <ppuview/software-rasterizer.h>
#include <ppuview/viewer.h>
#include <ppuview/vram-sheet.h>
#include <ppuview/webgpu-context.h>
#include <ytrace/ytrace.hpp>

#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace ppuview;

namespace {

enum class Mode { Tiles, Palette };

struct Frame {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;
};

struct Job {
    Mode mode = Mode::Tiles;
    std::vector<uint8_t> vram;
    std::vector<uint8_t> cgram;
    Rgba clear;

    // tiles
    std::vector<TileDescriptor> tiles;
    TileUniforms uniforms;

    // palette
    ViewedPalettes paletteView = ViewedPalettes::All;
};

Result<Job> buildJob(const Config& config, Mode mode,
                     const std::string& vramPath, const std::string& cgramPath,
                     uint32_t& width, uint32_t& height) {
    Job job;
    job.mode = mode;

    if (auto res = config.validateNumbers(); !res) {
        return Err<Job>("bad configuration", res);
    }

    auto clearRes = config.clearColor();
    if (!clearRes) return Err<Job>("bad render.clear-color", clearRes);
    job.clear = *clearRes;

    if (!cgramPath.empty()) {
        auto cgramRes = readBinaryFile(cgramPath);
        if (!cgramRes) return Err<Job>("cannot load CGRAM dump", cgramRes);
        job.cgram = std::move(*cgramRes);
    }

    if (mode == Mode::Palette) {
        auto viewRes = config.paletteView();
        if (!viewRes) return Err<Job>("bad palette.view", viewRes);
        job.paletteView = *viewRes;

        uint32_t cell = config.paletteCellSize();
        if (cell == 0) return Err<Job>("palette.cell-size must be positive");
        width = PALETTE_COLUMNS * cell;
        height = paletteViewMapping(job.paletteView).rowCount * cell;
        return Ok(std::move(job));
    }

    if (vramPath.empty()) {
        return Err<Job>("tiles mode needs --vram");
    }
    auto vramRes = readBinaryFile(vramPath);
    if (!vramRes) return Err<Job>("cannot load VRAM dump", vramRes);
    job.vram = std::move(*vramRes);

    auto viewRes = config.vramView();
    if (!viewRes) return Err<Job>("bad vram.view", viewRes);

    uint32_t scale = config.tileScale();
    if (scale == 0 || scale > TileParams::SCALE_MASK) {
        return Err<Job>("render.tile-scale must be in [1, 255]");
    }
    float zoom = config.zoom();
    if (!(zoom > 0.0f)) return Err<Job>("render.zoom must be positive");

    vram::SheetView sheet = vram::sheetView(*viewRes, scale);
    job.tiles = vram::sheetTiles(scale);

    width = static_cast<uint32_t>(std::lround(vram::SHEET_COLUMNS * scale * zoom));
    height = static_cast<uint32_t>(std::lround(sheet.rows * scale * zoom));

    job.uniforms.screenSize[0] = static_cast<float>(width);
    job.uniforms.screenSize[1] = static_cast<float>(height);
    job.uniforms.offset[0] = config.offsetX();
    job.uniforms.offset[1] = config.offsetY() + sheet.offsetY;
    job.uniforms.zoom = zoom;
    return Ok(std::move(job));
}

Result<Frame> renderOnCpu(const Job& job, uint32_t width, uint32_t height) {
    ColorTableData colors = {};
    if (!job.cgram.empty()) {
        auto colorsRes = colorTableFromCgram(job.cgram.data(), job.cgram.size());
        if (!colorsRes) return Err<Frame>("bad CGRAM dump", colorsRes);
        colors = *colorsRes;
    }

    Raster raster(width, height, job.clear);
    if (job.mode == Mode::Palette) {
        SoftwareRasterizer::drawPalette(raster, colors, job.paletteView);
    } else {
        auto res = SoftwareRasterizer::drawTiles(raster, job.vram.data(), job.vram.size(),
                                                 colors, job.tiles, job.uniforms);
        if (!res) return Err<Frame>("software rasterizer failed", res);
    }
    return Ok(Frame{width, height, raster.toRgba8()});
}

Result<Frame> renderOnGpu(const Job& job, uint32_t width, uint32_t height) {
    auto ctxRes = WebGPUContext::createHeadless();
    if (!ctxRes) return Err<Frame>("no WebGPU device", ctxRes);

    auto viewerRes = Viewer::create(*ctxRes);
    if (!viewerRes) return Err<Frame>("cannot set up renderers", viewerRes);
    auto& viewer = *viewerRes;

    if (!job.cgram.empty()) {
        if (auto res = viewer->loadCgram(job.cgram.data(), job.cgram.size()); !res) {
            return Err<Frame>("bad CGRAM dump", res);
        }
    }

    Result<std::vector<uint8_t>> pixels;
    if (job.mode == Mode::Palette) {
        pixels = viewer->renderPalette(job.paletteView, width, height, job.clear);
    } else {
        if (auto res = viewer->loadVram(job.vram.data(), job.vram.size()); !res) {
            return Err<Frame>("bad VRAM dump", res);
        }
        pixels = viewer->renderTiles(job.tiles, job.uniforms, width, height, job.clear);
    }
    if (!pixels) return Err<Frame>("GPU render failed", pixels);
    return Ok(Frame{width, height, std::move(*pixels)});
}

} // namespace

int main(int argc, const char** argv) {
    args::ArgumentParser parser("ppuview-render",
        "Render SNES VRAM tiles or CGRAM palettes to a PNG image.");
    parser.Prog("ppuview-render");

    // SPDLOG_LEVEL=debug shows allocations and shader diagnostics
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> modeFlag(parser, "mode",
        "What to draw: tiles or palette (default: tiles)", {'m', "mode"}, "tiles");
    args::ValueFlag<std::string> vramFlag(parser, "file",
        "Raw VRAM dump, up to 64 KiB", {"vram"});
    args::ValueFlag<std::string> cgramFlag(parser, "file",
        "Raw CGRAM dump, up to 512 bytes of BGR555", {"cgram"});
    args::ValueFlag<std::string> viewFlag(parser, "view",
        "all, background or sprites", {'v', "view"});
    args::ValueFlag<float> zoomFlag(parser, "zoom",
        "Zoom factor for tile sheets", {'z', "zoom"});
    args::ValueFlag<int> scaleFlag(parser, "pixels",
        "Tile size before zoom", {'s', "scale"});
    args::ValueFlag<std::string> configFlag(parser, "file",
        "Config file (default: $XDG_CONFIG_HOME/ppuview/config.yaml)", {'c', "config"});
    args::ValueFlag<std::string> outFlag(parser, "file",
        "Output PNG (default: ppuview.png)", {'o', "out"}, "ppuview.png");
    args::Flag cpuFlag(parser, "cpu",
        "Use the software rasterizer instead of the GPU", {"cpu"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    Mode mode;
    std::string modeName = args::get(modeFlag);
    if (modeName == "tiles") {
        mode = Mode::Tiles;
    } else if (modeName == "palette") {
        mode = Mode::Palette;
    } else {
        std::cerr << "ppuview-render: unknown mode '" << modeName << "'\n";
        return 1;
    }

    // Command line wins over config file and environment
    YAML::Node overrides(YAML::NodeType::Map);
    if (viewFlag) {
        overrides[mode == Mode::Palette ? "palette" : "vram"]["view"] = args::get(viewFlag);
    }
    if (zoomFlag) overrides["render"]["zoom"] = args::get(zoomFlag);
    if (scaleFlag) overrides["render"]["tile-scale"] = args::get(scaleFlag);

    auto configRes = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configRes) {
        yerror("{}", error_msg(configRes));
        return 1;
    }

    uint32_t width = 0, height = 0;
    auto jobRes = buildJob(**configRes, mode,
                           vramFlag ? args::get(vramFlag) : "",
                           cgramFlag ? args::get(cgramFlag) : "",
                           width, height);
    if (!jobRes) {
        yerror("{}", error_msg(jobRes));
        return 1;
    }

    auto frameRes = cpuFlag ? renderOnCpu(*jobRes, width, height)
                            : renderOnGpu(*jobRes, width, height);
    if (!frameRes) {
        yerror("{}", error_msg(frameRes));
        return 1;
    }

    if (auto res = writePng(args::get(outFlag), frameRes->width, frameRes->height,
                            frameRes->pixels); !res) {
        yerror("{}", error_msg(res));
        return 1;
    }
    return 0;
}
