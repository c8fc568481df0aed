#pragma once

#include <ppuview/wgpu-compat.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ppuview {

// Tracks every buffer/texture the renderers create so table uploads and
// offscreen targets show up in the log with their names and sizes.
class GpuAllocator {
public:
    using Ptr = std::shared_ptr<GpuAllocator>;

    explicit GpuAllocator(WGPUDevice device);
    ~GpuAllocator() = default;

    // Name is taken from desc.label
    WGPUBuffer createBuffer(const WGPUBufferDescriptor& desc);
    void releaseBuffer(WGPUBuffer buffer);

    // Only 4-byte-per-texel color formats are used here
    WGPUTexture createTexture(const WGPUTextureDescriptor& desc);
    void releaseTexture(WGPUTexture texture);

    uint64_t totalAllocatedBytes() const { return _totalBytes; }
    uint64_t peakAllocatedBytes() const { return _peakBytes; }
    uint32_t allocationCount() const { return static_cast<uint32_t>(_allocations.size()); }

    void dumpAllocations() const;

private:
    enum class AllocType { Buffer, Texture };

    struct Allocation {
        std::string name;
        uint64_t size;
        AllocType type;
        void* handle;
    };

    static std::string labelToString(WGPUStringView label);
    void track(Allocation allocation);
    bool forget(void* handle, AllocType type);

    WGPUDevice _device;
    std::vector<Allocation> _allocations;
    uint64_t _totalBytes = 0;
    uint64_t _peakBytes = 0;
};

} // namespace ppuview
