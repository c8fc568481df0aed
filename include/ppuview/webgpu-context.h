#pragma once

#include <ppuview/gpu-context.h>
#include <ppuview/result.hpp>
#include <webgpu/webgpu.h>
#include <memory>

namespace ppuview {

// Owns instance, adapter, device and queue. There is no surface: the
// renderers draw into whatever pass the host gives them, and tools/tests
// draw into an OffscreenTarget.
class WebGPUContext {
public:
    using Ptr = std::shared_ptr<WebGPUContext>;

    static Result<Ptr> createHeadless(
        WGPUTextureFormat targetFormat = WGPUTextureFormat_RGBA8Unorm) noexcept;

    ~WebGPUContext();

    // Non-copyable
    WebGPUContext(const WebGPUContext&) = delete;
    WebGPUContext& operator=(const WebGPUContext&) = delete;

    WGPUDevice getDevice() const noexcept { return device_; }

    GPUContext gpu() const noexcept { return {device_, queue_, targetFormat_}; }

    // Block until all submitted work has completed
    Result<void> waitIdle() noexcept;

private:
    explicit WebGPUContext(WGPUTextureFormat targetFormat) noexcept;

    Result<void> init() noexcept;

    WGPUInstance instance_ = nullptr;
    WGPUAdapter adapter_ = nullptr;
    WGPUDevice device_ = nullptr;
    WGPUQueue queue_ = nullptr;
    WGPUTextureFormat targetFormat_ = WGPUTextureFormat_RGBA8Unorm;
};

} // namespace ppuview
