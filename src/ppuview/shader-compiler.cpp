#include <ppuview/shader-compiler.h>
#include <ppuview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <sstream>

namespace ppuview {

namespace {

struct CompilationState {
    const std::string* label = nullptr;
    const std::string* source = nullptr;
    bool done = false;
    uint32_t errorCount = 0;
    std::string firstError;
};

void dumpSourceContext(const std::string& source, uint64_t errorLine) {
    std::istringstream iss(source);
    std::string line;
    uint64_t lineNum = 1;
    while (std::getline(iss, line)) {
        if (lineNum + 2 >= errorLine && lineNum <= errorLine + 2) {
            yerror("{:4d}: {}", lineNum, line);
        }
        lineNum++;
    }
}

} // namespace

Result<WGPUShaderModule> compileShaderModule(WGPUDevice device,
                                             const std::string& label,
                                             const std::string& source) {
    if (!device) {
        return Err<WGPUShaderModule>("compileShaderModule: null device");
    }

    int lineCount = static_cast<int>(std::count(source.begin(), source.end(), '\n')) + 1;
    ydebug("ShaderCompiler: compiling '{}' ({} lines)", label, lineCount);

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    WGPU_SHADER_CODE(wgslDesc, source);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.label = {.data = label.c_str(), .length = label.size()};
    shaderDesc.nextInChain = &wgslDesc.chain;

    WGPUShaderModule module = wgpuDeviceCreateShaderModule(device, &shaderDesc);
    if (!module) {
        return Err<WGPUShaderModule>("Failed to create shader module '" + label + "'");
    }

    CompilationState state;
    state.label = &label;
    state.source = &source;

    WGPUCompilationInfoCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUCompilationInfoRequestStatus,
                         WGPUCompilationInfo const* info,
                         void* userdata1, void*) {
        auto* st = static_cast<CompilationState*>(userdata1);
        if (info) {
            for (size_t i = 0; i < info->messageCount; i++) {
                const auto& msg = info->messages[i];
                std::string message(msg.message.data ? msg.message.data : "",
                                    msg.message.data ? msg.message.length : 0);
                if (msg.type == WGPUCompilationMessageType_Error) {
                    yerror("Shader '{}' error: line {}: {}", *st->label, msg.lineNum, message);
                    dumpSourceContext(*st->source, msg.lineNum);
                    if (st->errorCount++ == 0) {
                        st->firstError = "line " + std::to_string(msg.lineNum) + ": " + message;
                    }
                } else if (msg.type == WGPUCompilationMessageType_Warning) {
                    ywarn("Shader '{}' warning: line {}: {}", *st->label, msg.lineNum, message);
                }
            }
        }
        st->done = true;
    };
    cbInfo.userdata1 = &state;
    wgpuShaderModuleGetCompilationInfo(module, cbInfo);
    while (!state.done) WGPU_DEVICE_TICK(device);

    if (state.errorCount > 0) {
        wgpuShaderModuleRelease(module);
        return Err<WGPUShaderModule>("Shader '" + label + "' failed to compile (" +
                                     std::to_string(state.errorCount) + " errors, first at " +
                                     state.firstError + ")");
    }

    ydebug("ShaderCompiler: '{}' compiled", label);
    return Ok(module);
}

} // namespace ppuview
