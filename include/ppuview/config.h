#pragma once

#include <ppuview/palette-view.h>
#include <ppuview/result.hpp>
#include <ppuview/snes-color.h>
#include <ppuview/vram-sheet.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ppuview {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then the YAML file (configPath or the XDG location), then
    // PPUVIEW_* environment variables, then cmdOverrides
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "render.zoom")
    // Returns nullopt if the key doesn't exist or doesn't convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "PPUVIEW_";

    static constexpr const char* KEY_RENDER_ZOOM = "render.zoom";
    static constexpr const char* KEY_RENDER_OFFSET_X = "render.offset-x";
    static constexpr const char* KEY_RENDER_OFFSET_Y = "render.offset-y";
    static constexpr const char* KEY_RENDER_TILE_SCALE = "render.tile-scale";
    static constexpr const char* KEY_RENDER_CLEAR_COLOR = "render.clear-color";
    static constexpr const char* KEY_PALETTE_VIEW = "palette.view";
    static constexpr const char* KEY_PALETTE_CELL_SIZE = "palette.cell-size";
    static constexpr const char* KEY_VRAM_VIEW = "vram.view";

    float zoom() const;
    float offsetX() const;
    float offsetY() const;
    uint32_t tileScale() const;
    uint32_t paletteCellSize() const;

    // Fails naming the first numeric key that is set but does not convert;
    // the numeric accessors above would silently fall back to defaults
    Result<void> validateNumbers() const;

    // These parse strings and fail on malformed values
    Result<Rgba> clearColor() const;
    Result<ViewedPalettes> paletteView() const;
    Result<vram::ViewedVramTiles> vramView() const;

    // "RRGGBBAA" or "RRGGBB" (opaque)
    static Result<Rgba> parseHexColor(const std::string& hex);

    // "render.tile-scale" -> "PPUVIEW_RENDER_TILE_SCALE"
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static std::vector<std::string> splitPath(const std::string& path);
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace ppuview
