#pragma once

// Host mirrors of the WGSL uniform blocks. Shared with the software
// rasterizer, so no WebGPU types here.

namespace ppuview {

// Per-draw scalars of the tile pipeline
struct TileUniforms {
    float screenSize[2] = {0.0f, 0.0f};  // viewport in pixels
    float offset[2] = {0.0f, 0.0f};      // global pan, pre-zoom pixels
    float zoom = 1.0f;
    float _pad[3] = {0.0f, 0.0f, 0.0f};
};

static_assert(sizeof(TileUniforms) == 32, "TileUniforms must match WGSL layout");

// Vertical texture range of the palette grid
struct PaletteUniforms {
    float v0 = 0.0f;
    float v1 = 1.0f;
    float _pad[2] = {0.0f, 0.0f};
};

static_assert(sizeof(PaletteUniforms) == 16, "PaletteUniforms must match WGSL layout");

} // namespace ppuview
