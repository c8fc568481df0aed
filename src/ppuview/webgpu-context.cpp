#include <ppuview/webgpu-context.h>
#include <ppuview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <string>

namespace ppuview {

static std::string viewToString(WGPUStringView view) {
    if (!view.data) return "unknown";
    if (view.length == WGPU_STRLEN) return std::string(view.data);
    return std::string(view.data, view.length);
}

Result<WebGPUContext::Ptr> WebGPUContext::createHeadless(WGPUTextureFormat targetFormat) noexcept {
    auto ctx = Ptr(new WebGPUContext(targetFormat));
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to initialize WebGPUContext", res);
    }
    return Ok(std::move(ctx));
}

WebGPUContext::WebGPUContext(WGPUTextureFormat targetFormat) noexcept
    : targetFormat_(targetFormat) {}

WebGPUContext::~WebGPUContext() {
    if (queue_) wgpuQueueRelease(queue_);
    if (device_) wgpuDeviceRelease(device_);
    if (adapter_) wgpuAdapterRelease(adapter_);
    if (instance_) wgpuInstanceRelease(instance_);
}

Result<void> WebGPUContext::init() noexcept {
    WGPUInstanceDescriptor instanceDesc = {};
    instance_ = wgpuCreateInstance(&instanceDesc);
    if (!instance_) {
        return Err<void>("Failed to create WebGPU instance");
    }

    // Request adapter
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    WGPURequestAdapterCallbackInfo adapterCallbackInfo = {};
    adapterCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                                      WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestAdapterStatus_Success) {
            *static_cast<WGPUAdapter*>(userdata1) = adapter;
        } else {
            yerror("Failed to get WebGPU adapter: {}", viewToString(message));
        }
    };
    adapterCallbackInfo.userdata1 = &adapter_;
    wgpuInstanceRequestAdapter(instance_, &adapterOpts, adapterCallbackInfo);

    if (!adapter_) {
        return Err<void>("Failed to get WebGPU adapter");
    }

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = WGPU_STR("ppuview device");
    deviceDesc.requiredFeatureCount = 0;
    deviceDesc.requiredLimits = nullptr;
    deviceDesc.defaultQueue.label = WGPU_STR("default queue");
    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const*, WGPUErrorType type,
                                                         WGPUStringView message, void*, void*) {
        yerror("WebGPU error ({}): {}", static_cast<int>(type), viewToString(message));
    };

    WGPURequestDeviceCallbackInfo deviceCallbackInfo = {};
    deviceCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                                     WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestDeviceStatus_Success) {
            *static_cast<WGPUDevice*>(userdata1) = device;
        } else {
            yerror("Failed to get WebGPU device: {}", viewToString(message));
        }
    };
    deviceCallbackInfo.userdata1 = &device_;
    wgpuAdapterRequestDevice(adapter_, &deviceDesc, deviceCallbackInfo);

    if (!device_) {
        return Err<void>("Failed to get WebGPU device");
    }

    queue_ = wgpuDeviceGetQueue(device_);
    if (!queue_) {
        return Err<void>("Failed to get WebGPU queue");
    }

    yinfo("WebGPUContext: headless device ready (target format {})",
          static_cast<int>(targetFormat_));
    return Ok();
}

Result<void> WebGPUContext::waitIdle() noexcept {
    struct WorkDone {
        bool done = false;
        WGPUQueueWorkDoneStatus status = WGPUQueueWorkDoneStatus_Success;
    } work;

    WGPUQueueWorkDoneCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUQueueWorkDoneStatus status, WGPUStringView, void* ud, void*) {
        auto* w = static_cast<WorkDone*>(ud);
        w->status = status;
        w->done = true;
    };
    cbInfo.userdata1 = &work;
    wgpuQueueOnSubmittedWorkDone(queue_, cbInfo);
    while (!work.done) WGPU_DEVICE_TICK(device_);

    if (work.status != WGPUQueueWorkDoneStatus_Success) {
        return Err<void>("Queue work did not complete");
    }
    return Ok();
}

} // namespace ppuview
