#pragma once

#include <ppuview/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ppuview {

// One Color Table entry, laid out as WGSL vec4<f32>
struct Rgba {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;

    bool operator==(const Rgba&) const = default;
};

static_assert(sizeof(Rgba) == 16, "Rgba must match vec4<f32>");

/**
 * SNES CGRAM color word: 0bTBBBBBGGGGGRRRRR, little-endian in memory.
 * Bit 15 is only meaningful to tools: set means transparent.
 */
struct Bgr555 {
    uint16_t value = 0;

    static constexpr uint16_t CHANNEL_MAX = 0x1F;
    static constexpr uint16_t TRANSPARENT_BIT = 0x8000;

    constexpr uint16_t red() const { return value & CHANNEL_MAX; }
    constexpr uint16_t green() const { return (value >> 5) & CHANNEL_MAX; }
    constexpr uint16_t blue() const { return (value >> 10) & CHANNEL_MAX; }
    constexpr bool transparent() const { return (value & TRANSPARENT_BIT) != 0; }

    Rgba toRgba() const;
    static Bgr555 fromRgba(const Rgba& color);
};

using ColorTableData = std::array<Rgba, 256>;

/**
 * Convert a raw CGRAM dump (little-endian BGR555 words) into a Color Table.
 * Accepts up to 512 bytes; missing entries stay transparent black.
 */
Result<ColorTableData> colorTableFromCgram(const uint8_t* data, size_t size);

} // namespace ppuview
