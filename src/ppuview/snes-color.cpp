#include <ppuview/snes-color.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace ppuview {

Rgba Bgr555::toRgba() const {
    constexpr float cmf = static_cast<float>(CHANNEL_MAX);
    return {
        static_cast<float>(red()) / cmf,
        static_cast<float>(green()) / cmf,
        static_cast<float>(blue()) / cmf,
        transparent() ? 0.0f : 1.0f,
    };
}

Bgr555 Bgr555::fromRgba(const Rgba& color) {
    constexpr float cmf = static_cast<float>(CHANNEL_MAX);
    auto channel = [](float c) {
        return static_cast<uint16_t>(std::lround(std::clamp(c, 0.0f, 1.0f) * cmf)) & CHANNEL_MAX;
    };
    uint16_t t = color.a < 0.5f ? TRANSPARENT_BIT : 0;
    return {static_cast<uint16_t>(t | (channel(color.b) << 10) | (channel(color.g) << 5) | channel(color.r))};
}

Result<ColorTableData> colorTableFromCgram(const uint8_t* data, size_t size) {
    if (size > sizeof(uint16_t) * 256) {
        return Err<ColorTableData>("CGRAM dump is " + std::to_string(size) +
                                   " bytes, at most 512 expected");
    }
    if (size % 2 != 0) {
        return Err<ColorTableData>("CGRAM dump has an odd byte count");
    }
    if (size > 0 && !data) {
        return Err<ColorTableData>("colorTableFromCgram: null data");
    }

    ColorTableData table = {};
    for (size_t i = 0; i < size / 2; i++) {
        Bgr555 c{static_cast<uint16_t>(data[2 * i] | (data[2 * i + 1] << 8))};
        table[i] = c.toRgba();
    }
    return Ok(table);
}

} // namespace ppuview
