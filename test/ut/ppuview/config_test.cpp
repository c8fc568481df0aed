//=============================================================================
// Config: defaults, YAML file, PPUVIEW_* environment, command line
//=============================================================================

#include <boost/ut.hpp>

#include <ppuview/config.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace boost::ut;
using namespace ppuview;

namespace {

std::string writeTempConfig(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << contents;
    return path.string();
}

// Keep the user's own config out of the tests
void isolateXdg() {
    auto dir = std::filesystem::temp_directory_path() / "ppuview-ut-xdg";
    std::filesystem::create_directories(dir);
    setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
}

} // namespace

suite config_tests = [] {
    "defaults"_test = [] {
        isolateXdg();
        auto res = Config::create();
        expect(res.has_value() >> fatal) << error_msg(res);
        auto config = *res;

        expect(config->zoom() == 2.0_f);
        expect(config->offsetX() == 0.0_f);
        expect(config->tileScale() == 8_u);
        expect(config->paletteCellSize() == 16_u);
        expect(*config->paletteView() == ViewedPalettes::All);
        expect(*config->vramView() == vram::ViewedVramTiles::All);

        auto clear = config->clearColor();
        expect(clear.has_value() >> fatal);
        expect(*clear == Rgba{});
    };

    "dotted paths"_test = [] {
        isolateXdg();
        auto config = *Config::create();
        expect(config->has("render.zoom"));
        expect(config->has("render"));
        expect(!config->has("render.nothing"));
        expect(!config->has("render.zoom.deeper"));
        expect(!config->get<int>("nothing.here").has_value());
        expect(config->get<int>("nothing.here", 42) == 42_i);
        // Wrong type converts to nullopt, not an exception
        expect(!config->get<int>("palette.view").has_value());
    };

    "file overrides defaults"_test = [] {
        isolateXdg();
        auto path = writeTempConfig("ppuview-ut-file.yaml",
            "render:\n"
            "  zoom: 3.5\n"
            "  clear-color: \"FF000080\"\n"
            "palette:\n"
            "  view: sprites\n");
        auto res = Config::create(path);
        expect(res.has_value() >> fatal) << error_msg(res);
        auto config = *res;

        expect(config->zoom() == 3.5_f);
        expect(config->tileScale() == 8_u);  // untouched default
        expect(*config->paletteView() == ViewedPalettes::SpritesOnly);

        auto clear = config->clearColor();
        expect(clear.has_value() >> fatal);
        expect(clear->r == 1.0_f);
        expect(clear->g == 0.0_f);
        expect(std::abs(clear->a - 128.0f / 255.0f) < 1e-6f);
        std::filesystem::remove(path);
    };

    "missing explicit file is an error"_test = [] {
        isolateXdg();
        auto res = Config::create("/nonexistent/ppuview.yaml");
        expect(!res.has_value());
    };

    "malformed YAML is an error"_test = [] {
        isolateXdg();
        auto path = writeTempConfig("ppuview-ut-bad.yaml", "render: [zoom: 2\n");
        auto res = Config::create(path);
        expect(!res.has_value());
        std::filesystem::remove(path);
    };

    "environment overrides file, command line overrides environment"_test = [] {
        isolateXdg();
        auto path = writeTempConfig("ppuview-ut-env.yaml", "render:\n  tile-scale: 16\n  zoom: 1.0\n");
        setenv("PPUVIEW_RENDER_TILE_SCALE", "32", 1);
        setenv("PPUVIEW_RENDER_ZOOM", "4", 1);

        YAML::Node overrides;
        overrides["render"]["zoom"] = 0.5f;

        auto res = Config::create(path, overrides);
        unsetenv("PPUVIEW_RENDER_TILE_SCALE");
        unsetenv("PPUVIEW_RENDER_ZOOM");
        std::filesystem::remove(path);

        expect(res.has_value() >> fatal) << error_msg(res);
        expect((*res)->tileScale() == 32_u);
        expect((*res)->zoom() == 0.5_f);
    };

    "XDG config file is picked up"_test = [] {
        isolateXdg();
        auto dir = std::filesystem::temp_directory_path() / "ppuview-ut-xdg" / "ppuview";
        std::filesystem::create_directories(dir);
        {
            std::ofstream file(dir / "config.yaml");
            file << "vram:\n  view: background\n";
        }
        auto res = Config::create();
        std::filesystem::remove(dir / "config.yaml");

        expect(res.has_value() >> fatal);
        expect(*(*res)->vramView() == vram::ViewedVramTiles::BackgroundOnly);
    };

    "env var names"_test = [] {
        expect(Config::pathToEnvVar("render.tile-scale") == std::string("PPUVIEW_RENDER_TILE_SCALE"));
        expect(Config::pathToEnvVar("vram.view") == std::string("PPUVIEW_VRAM_VIEW"));
    };

    "hex colors"_test = [] {
        auto opaque = Config::parseHexColor("#00FF00");
        expect(opaque.has_value() >> fatal);
        expect(opaque->g == 1.0_f);
        expect(opaque->a == 1.0_f);

        expect(!Config::parseHexColor("12345").has_value());
        expect(!Config::parseHexColor("GG000000").has_value());
    };

    "bad view names surface as errors"_test = [] {
        isolateXdg();
        YAML::Node overrides;
        overrides["palette"]["view"] = "upside-down";
        auto config = *Config::create("", overrides);
        expect(!config->paletteView().has_value());
    };

    "malformed numbers are reported, not replaced by defaults"_test = [] {
        isolateXdg();
        auto defaults = Config::create();
        expect(defaults.has_value() >> fatal);
        expect((*defaults)->validateNumbers().has_value());

        YAML::Node scale;
        scale["render"]["tile-scale"] = "-5";
        auto badScale = *Config::create("", scale);
        auto scaleRes = badScale->validateNumbers();
        expect(!scaleRes.has_value());
        expect(error_msg(scaleRes).find("render.tile-scale") != std::string::npos);

        YAML::Node zoom;
        zoom["render"]["zoom"] = "abc";
        auto badZoom = *Config::create("", zoom);
        auto zoomRes = badZoom->validateNumbers();
        expect(!zoomRes.has_value());
        expect(error_msg(zoomRes).find("render.zoom") != std::string::npos);
    };
};
