#pragma once

#include <webgpu/webgpu.h>

namespace ppuview {

// Low-level GPU context - pure WebGPU handles shared by the renderers and
// resource tables. Owned by WebGPUContext (or by the embedding host).
struct GPUContext {
    WGPUDevice device;
    WGPUQueue queue;
    WGPUTextureFormat targetFormat;
};

} // namespace ppuview
