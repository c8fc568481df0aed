#include <ppuview/gpu-allocator.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace ppuview {

GpuAllocator::GpuAllocator(WGPUDevice device)
    : _device(device) {}

std::string GpuAllocator::labelToString(WGPUStringView label) {
    if (!label.data) return "(unnamed)";
    if (label.length == WGPU_STRLEN) return std::string(label.data);
    return std::string(label.data, label.length);
}

WGPUBuffer GpuAllocator::createBuffer(const WGPUBufferDescriptor& desc) {
    std::string name = labelToString(desc.label);

    WGPUBuffer buffer = wgpuDeviceCreateBuffer(_device, &desc);
    if (!buffer) {
        yerror("GpuAllocator: failed to create buffer '{}'", name);
        return nullptr;
    }

    track({name, desc.size, AllocType::Buffer, buffer});
    ydebug("GPU [+] buffer '{}': {} bytes, total {} bytes", name, desc.size, _totalBytes);
    return buffer;
}

void GpuAllocator::releaseBuffer(WGPUBuffer buffer) {
    if (!buffer) return;
    if (!forget(buffer, AllocType::Buffer)) {
        ywarn("GpuAllocator: releaseBuffer called for untracked buffer");
    }
    wgpuBufferRelease(buffer);
}

WGPUTexture GpuAllocator::createTexture(const WGPUTextureDescriptor& desc) {
    std::string name = labelToString(desc.label);

    WGPUTexture texture = wgpuDeviceCreateTexture(_device, &desc);
    if (!texture) {
        yerror("GpuAllocator: failed to create texture '{}'", name);
        return nullptr;
    }

    uint64_t size = static_cast<uint64_t>(desc.size.width) * desc.size.height
                  * desc.size.depthOrArrayLayers * 4;
    track({name, size, AllocType::Texture, texture});
    ydebug("GPU [+] texture '{}': {}x{} = {} bytes, total {} bytes",
           name, desc.size.width, desc.size.height, size, _totalBytes);
    return texture;
}

void GpuAllocator::releaseTexture(WGPUTexture texture) {
    if (!texture) return;
    if (!forget(texture, AllocType::Texture)) {
        ywarn("GpuAllocator: releaseTexture called for untracked texture");
    }
    wgpuTextureRelease(texture);
}

void GpuAllocator::track(Allocation allocation) {
    _totalBytes += allocation.size;
    _peakBytes = std::max(_peakBytes, _totalBytes);
    _allocations.push_back(std::move(allocation));
}

bool GpuAllocator::forget(void* handle, AllocType type) {
    auto it = std::find_if(_allocations.begin(), _allocations.end(),
        [handle, type](const Allocation& a) {
            return a.type == type && a.handle == handle;
        });
    if (it == _allocations.end()) return false;

    _totalBytes -= it->size;
    ydebug("GPU [-] {} '{}': {} bytes, total {} bytes",
           type == AllocType::Buffer ? "buffer" : "texture", it->name, it->size, _totalBytes);
    _allocations.erase(it);
    return true;
}

void GpuAllocator::dumpAllocations() const {
    yinfo("GPU allocations: {} resources, {} bytes live, {} bytes peak",
          _allocations.size(), _totalBytes, _peakBytes);
    for (const auto& a : _allocations) {
        const char* type = (a.type == AllocType::Buffer) ? "buffer" : "texture";
        yinfo("  {:>8} {:>10} bytes  {}", type, a.size, a.name);
    }
}

} // namespace ppuview
