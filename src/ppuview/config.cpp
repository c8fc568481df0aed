#include <ppuview/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ppuview {

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<void> Config::init() noexcept {
    loadDefaults();

    if (!_configPath.empty()) {
        // An explicitly requested file must load
        if (auto res = loadFile(_configPath); !res) {
            return Err<void>("Failed to load config file " + _configPath, res);
        }
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                yinfo("Loaded config from: {}", xdgPath.string());
            }
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["render"]["zoom"] = 2.0f;
    _config["render"]["offset-x"] = 0.0f;
    _config["render"]["offset-y"] = 0.0f;
    _config["render"]["tile-scale"] = 8;
    _config["render"]["clear-color"] = "00000000";
    _config["palette"]["view"] = "all";
    _config["palette"]["cell-size"] = 16;
    _config["vram"]["view"] = "all";
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err<void>("Config file root is not a map: " + path);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

// Only keys that have a default can be overridden from the environment
void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* val = std::getenv(envVar.c_str());
        if (val) {
            it->second = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (it->second.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], it->second);
        } else {
            target[key] = it->second;
        }
    }
}

std::vector<std::string> Config::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return YAML::Node();

    // Walk const nodes; assigning non-const YAML::Node handles would write
    // into the tree
    const YAML::Node& rootNode = _config;
    std::vector<YAML::Node> chain;
    chain.push_back(rootNode);
    for (const auto& part : parts) {
        const YAML::Node& current = chain.back();
        if (!current.IsMap()) return YAML::Node();
        YAML::Node next = current[part];
        if (!next) return YAML::Node();
        chain.push_back(next);
    }
    return chain.back();
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "ppuview" / "config.yaml";
}

//-----------------------------------------------------------------------------
// Typed accessors
//-----------------------------------------------------------------------------

float Config::zoom() const {
    return get<float>(KEY_RENDER_ZOOM, 2.0f);
}

float Config::offsetX() const {
    return get<float>(KEY_RENDER_OFFSET_X, 0.0f);
}

float Config::offsetY() const {
    return get<float>(KEY_RENDER_OFFSET_Y, 0.0f);
}

uint32_t Config::tileScale() const {
    return get<uint32_t>(KEY_RENDER_TILE_SCALE, 8);
}

uint32_t Config::paletteCellSize() const {
    return get<uint32_t>(KEY_PALETTE_CELL_SIZE, 16);
}

Result<void> Config::validateNumbers() const {
    for (const char* key : {KEY_RENDER_ZOOM, KEY_RENDER_OFFSET_X, KEY_RENDER_OFFSET_Y}) {
        if (has(key) && !get<float>(key)) {
            return Err<void>(std::string("not a number: ") + key);
        }
    }
    for (const char* key : {KEY_RENDER_TILE_SCALE, KEY_PALETTE_CELL_SIZE}) {
        if (has(key) && !get<uint32_t>(key)) {
            return Err<void>(std::string("not a non-negative integer: ") + key);
        }
    }
    return Ok();
}

Result<Rgba> Config::clearColor() const {
    return parseHexColor(get<std::string>(KEY_RENDER_CLEAR_COLOR, "00000000"));
}

Result<ViewedPalettes> Config::paletteView() const {
    return parseViewedPalettes(get<std::string>(KEY_PALETTE_VIEW, "all"));
}

Result<vram::ViewedVramTiles> Config::vramView() const {
    return vram::parseViewedVramTiles(get<std::string>(KEY_VRAM_VIEW, "all"));
}

Result<Rgba> Config::parseHexColor(const std::string& hex) {
    std::string digits = hex;
    if (!digits.empty() && digits[0] == '#') digits.erase(0, 1);
    if (digits.size() == 6) digits += "FF";
    if (digits.size() != 8) {
        return Err<Rgba>("color '" + hex + "' is not RRGGBB or RRGGBBAA");
    }

    float channels[4];
    for (size_t i = 0; i < 4; i++) {
        unsigned value = 0;
        for (size_t j = 0; j < 2; j++) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[i * 2 + j])));
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<unsigned>(c - 'a' + 10);
            else return Err<Rgba>("color '" + hex + "' has a non-hex digit");
        }
        channels[i] = static_cast<float>(value) / 255.0f;
    }
    return Ok(Rgba{channels[0], channels[1], channels[2], channels[3]});
}

} // namespace ppuview
