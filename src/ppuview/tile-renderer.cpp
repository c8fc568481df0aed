#include <ppuview/tile-renderer.h>
#include <ppuview/shader-compiler.h>
#include <ppuview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <string>

namespace ppuview {

//-----------------------------------------------------------------------------
// WGSL: quad expansion (vertex) and planar tile decode (fragment)
//-----------------------------------------------------------------------------
static const char* TILE_SHADER = R"(
struct Uniforms {
    screenSize: vec2<f32>,
    offset: vec2<f32>,
    zoom: f32,
    _pad0: f32,
    _pad1: f32,
    _pad2: f32,
}

@group(0) @binding(0) var<uniform> u: Uniforms;
@group(0) @binding(1) var<storage, read> graphics: array<vec4<u32>, 4096>;
@group(0) @binding(2) var<storage, read> colors: array<vec4<f32>, 256>;

struct VertexOutput {
    @builtin(position) position: vec4<f32>,
    @location(0) texCoord: vec2<f32>,
    @location(1) @interpolate(flat) tileId: u32,
    @location(2) @interpolate(flat) params: u32,
}

// tile = (x, y, tileId, params); x and y are signed
@vertex fn vs_main(@builtin(vertex_index) vi: u32,
                   @location(0) tile: vec4<u32>) -> VertexOutput {
    let scale = f32(tile.w & 0xFFu);
    let local = vec2<f32>(f32(vi & 1u), f32(vi >> 1u)) * scale;
    let anchor = vec2<f32>(f32(bitcast<i32>(tile.x)), f32(bitcast<i32>(tile.y)));
    let pixel = (anchor + u.offset + local) * u.zoom;

    var out: VertexOutput;
    out.position = vec4<f32>((pixel / u.screenSize * 2.0 - 1.0) * vec2<f32>(1.0, -1.0), 0.0, 1.0);
    out.texCoord = local * u.zoom;
    out.tileId = tile.z;
    out.params = tile.w;
    return out;
}

@fragment fn fs_main(frag: VertexOutput) -> @location(0) vec4<f32> {
    let extent = f32(frag.params & 0xFFu) * u.zoom;
    let cell = clamp(floor(floor(frag.texCoord) * 8.0 / extent), vec2<f32>(0.0), vec2<f32>(7.0));
    var icoord = vec2<u32>(cell);
    if ((frag.params & 0x8000u) != 0u) {
        icoord.y = 7u - icoord.y;
    }
    if ((frag.params & 0x4000u) != 0u) {
        icoord.x = 7u - icoord.x;
    }

    // Record 2t: bitplanes 0/1, record 2t+1: bitplanes 2/3. Each u32 holds
    // two pixel rows; each 16-bit half is (odd plane << 8) | even plane.
    let planes01 = graphics[frag.tileId * 2u];
    let planes23 = graphics[frag.tileId * 2u + 1u];
    let shift = (icoord.y % 2u) * 16u;
    let lo = (planes01[icoord.y / 2u] >> shift) & 0xFFFFu;
    let hi = (planes23[icoord.y / 2u] >> shift) & 0xFFFFu;

    let colorIndex = ((lo >> (7u - icoord.x)) & 1u)
                   | (((lo >> (15u - icoord.x)) & 1u) << 1u)
                   | (((hi >> (7u - icoord.x)) & 1u) << 2u)
                   | (((hi >> (15u - icoord.x)) & 1u) << 3u);
    if (colorIndex == 0u) {
        discard;
    }

    let colorRow = (frag.params >> 8u) & 0xFu;
    return colors[colorIndex + colorRow * 16u];
}
)";

constexpr size_t INITIAL_INSTANCE_CAPACITY = 256;

const char* TileRenderer::shaderSource() {
    return TILE_SHADER;
}

//-----------------------------------------------------------------------------
// Creation and initialization
//-----------------------------------------------------------------------------

Result<std::unique_ptr<TileRenderer>> TileRenderer::create(const GPUContext& gpu,
                                                           GpuAllocator::Ptr allocator) {
    auto renderer = std::unique_ptr<TileRenderer>(new TileRenderer(gpu, std::move(allocator)));
    if (auto res = renderer->init(); !res) {
        return Err<std::unique_ptr<TileRenderer>>("Failed to init TileRenderer", res);
    }
    return Ok(std::move(renderer));
}

TileRenderer::TileRenderer(const GPUContext& gpu, GpuAllocator::Ptr allocator)
    : _gpu(gpu), _allocator(std::move(allocator)) {}

TileRenderer::~TileRenderer() {
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    if (_bindGroupLayout) wgpuBindGroupLayoutRelease(_bindGroupLayout);
    if (_pipeline) wgpuRenderPipelineRelease(_pipeline);
    if (_allocator) {
        _allocator->releaseBuffer(_uniformBuffer);
        _allocator->releaseBuffer(_instanceBuffer);
    }
}

Result<void> TileRenderer::init() {
    if (!_allocator) {
        return Err<void>("TileRenderer: null allocator");
    }

    auto moduleRes = compileShaderModule(_gpu.device, "tile shader", TILE_SHADER);
    if (!moduleRes) {
        return Err<void>("Failed to compile tile shader", moduleRes);
    }
    WGPUShaderModule shaderModule = *moduleRes;

    WGPUBindGroupLayoutEntry entries[3] = {};
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = sizeof(TileUniforms);

    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;
    entries[1].buffer.minBindingSize = GRAPHICS_TABLE_BYTES;

    entries[2].binding = 2;
    entries[2].visibility = WGPUShaderStage_Fragment;
    entries[2].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;
    entries[2].buffer.minBindingSize = sizeof(ColorTableData);

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = 3;
    layoutDesc.entries = entries;
    _bindGroupLayout = wgpuDeviceCreateBindGroupLayout(_gpu.device, &layoutDesc);
    if (!_bindGroupLayout) {
        wgpuShaderModuleRelease(shaderModule);
        return Err<void>("Failed to create tile bind group layout");
    }

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("tile uniforms");
    bufDesc.size = sizeof(TileUniforms);
    bufDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    _uniformBuffer = _allocator->createBuffer(bufDesc);
    if (!_uniformBuffer) {
        wgpuShaderModuleRelease(shaderModule);
        return Err<void>("Failed to create tile uniform buffer");
    }

    if (auto res = ensureInstanceCapacity(INITIAL_INSTANCE_CAPACITY); !res) {
        wgpuShaderModuleRelease(shaderModule);
        return res;
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &_bindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(_gpu.device, &pipelineLayoutDesc);

    // One vec4<u32> per instance
    WGPUVertexAttribute attribute = {};
    attribute.format = WGPUVertexFormat_Uint32x4;
    attribute.offset = 0;
    attribute.shaderLocation = 0;

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = sizeof(TileDescriptor);
    vertexLayout.stepMode = WGPUVertexStepMode_Instance;
    vertexLayout.attributeCount = 1;
    vertexLayout.attributes = &attribute;

    // No blending: decoded colors are written as-is
    WGPUColorTargetState colorTarget = {};
    colorTarget.format = _gpu.targetFormat;
    colorTarget.blend = nullptr;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragment = {};
    fragment.module = shaderModule;
    fragment.entryPoint = WGPU_STR("fs_main");
    fragment.targetCount = 1;
    fragment.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = WGPU_STR("tile pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
    pipelineDesc.vertex.bufferCount = 1;
    pipelineDesc.vertex.buffers = &vertexLayout;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleStrip;
    pipelineDesc.primitive.stripIndexFormat = WGPUIndexFormat_Undefined;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.fragment = &fragment;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = 0xFFFFFFFF;

    _pipeline = wgpuDeviceCreateRenderPipeline(_gpu.device, &pipelineDesc);

    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(shaderModule);

    if (!_pipeline) {
        return Err<void>("Failed to create tile pipeline");
    }

    yinfo("TileRenderer initialized");
    return Ok();
}

Result<void> TileRenderer::ensureInstanceCapacity(size_t tiles) {
    if (_instanceBuffer && tiles <= _instanceCapacity) {
        return Ok();
    }

    size_t capacity = std::max(_instanceCapacity, INITIAL_INSTANCE_CAPACITY);
    while (capacity < tiles) capacity *= 2;

    WGPUBufferDescriptor desc = {};
    desc.label = WGPU_STR("tile descriptors");
    desc.size = capacity * sizeof(TileDescriptor);
    desc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    WGPUBuffer buffer = _allocator->createBuffer(desc);
    if (!buffer) {
        return Err<void>("Failed to create tile descriptor buffer for " +
                         std::to_string(capacity) + " tiles");
    }

    _allocator->releaseBuffer(_instanceBuffer);
    _instanceBuffer = buffer;
    _instanceCapacity = capacity;
    return Ok();
}

//-----------------------------------------------------------------------------
// Descriptor stream and drawing
//-----------------------------------------------------------------------------

Result<void> TileRenderer::setTiles(const std::vector<TileDescriptor>& tiles) {
    if (auto res = ensureInstanceCapacity(tiles.size()); !res) {
        return Err<void>("TileRenderer::setTiles", res);
    }
    if (!tiles.empty()) {
        wgpuQueueWriteBuffer(_gpu.queue, _instanceBuffer, 0, tiles.data(),
                             tiles.size() * sizeof(TileDescriptor));
    }
    _tileCount = tiles.size();
    ydebug("TileRenderer: {} tiles", _tileCount);
    return Ok();
}

Result<void> TileRenderer::updateBindGroup(const GraphicsTable& graphics, const ColorTable& colors) {
    if (_bindGroup && _boundGraphics == graphics.buffer() && _boundColors == colors.buffer()) {
        return Ok();
    }
    if (_bindGroup) {
        wgpuBindGroupRelease(_bindGroup);
        _bindGroup = nullptr;
    }

    WGPUBindGroupEntry entries[3] = {};
    entries[0].binding = 0;
    entries[0].buffer = _uniformBuffer;
    entries[0].size = sizeof(TileUniforms);
    entries[1].binding = 1;
    entries[1].buffer = graphics.buffer();
    entries[1].size = graphics.byteSize();
    entries[2].binding = 2;
    entries[2].buffer = colors.buffer();
    entries[2].size = colors.byteSize();

    WGPUBindGroupDescriptor desc = {};
    desc.layout = _bindGroupLayout;
    desc.entryCount = 3;
    desc.entries = entries;
    _bindGroup = wgpuDeviceCreateBindGroup(_gpu.device, &desc);
    if (!_bindGroup) {
        return Err<void>("Failed to create tile bind group");
    }

    _boundGraphics = graphics.buffer();
    _boundColors = colors.buffer();
    return Ok();
}

Result<void> TileRenderer::render(WGPURenderPassEncoder pass,
                                  const GraphicsTable& graphics,
                                  const ColorTable& colors,
                                  const TileUniforms& uniforms) {
    if (!pass) {
        return Err<void>("TileRenderer::render: null pass");
    }
    if (uniforms.screenSize[0] <= 0.0f || uniforms.screenSize[1] <= 0.0f) {
        return Err<void>("TileRenderer::render: empty screen size");
    }
    if (_tileCount == 0) {
        return Ok();
    }
    if (auto res = updateBindGroup(graphics, colors); !res) {
        return res;
    }

    wgpuQueueWriteBuffer(_gpu.queue, _uniformBuffer, 0, &uniforms, sizeof(uniforms));

    wgpuRenderPassEncoderSetPipeline(pass, _pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, _bindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, _instanceBuffer, 0,
                                         _tileCount * sizeof(TileDescriptor));
    wgpuRenderPassEncoderDraw(pass, 4, static_cast<uint32_t>(_tileCount), 0, 0);
    return Ok();
}

} // namespace ppuview
