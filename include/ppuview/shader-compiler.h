#pragma once

#include <ppuview/result.hpp>
#include <webgpu/webgpu.h>
#include <string>

namespace ppuview {

/**
 * Compile a WGSL module and wait for its compilation info.
 *
 * Any error-level message makes this fail: the offending lines are dumped
 * to the log and the module is released. Warnings are logged only.
 *
 * @param device WebGPU device
 * @param label Module label (also used in log messages)
 * @param source WGSL source
 * @return Owned shader module or error
 */
Result<WGPUShaderModule> compileShaderModule(WGPUDevice device,
                                             const std::string& label,
                                             const std::string& source);

} // namespace ppuview
