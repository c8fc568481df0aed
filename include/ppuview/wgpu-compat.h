#pragma once

// Shorthands for the Dawn flavour of the WebGPU C API used throughout
// ppuview (WGPUStringView labels, callback-info structs, explicit ticking).

#include <webgpu/webgpu.h>

// Headless: nothing pumps callbacks unless the device is ticked
#define WGPU_DEVICE_TICK(device) wgpuDeviceTick(device)

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

// WGSL source from a std::string
#define WGPU_SHADER_CODE(desc, src)                                            \
  (desc).code = {.data = (src).c_str(), .length = (src).size()}

#define WGPU_COLOR_ATTACHMENT_CLEAR(attachment, r, g, b, a)                    \
  (attachment).clearValue = {(r), (g), (b), (a)}
