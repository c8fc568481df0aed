#include <ppuview/palette-renderer.h>
#include <ppuview/shader-compiler.h>
#include <ppuview/wgpu-compat.h>
#include <ytrace/ytrace.hpp>

namespace ppuview {

static const char* PALETTE_SHADER = R"(
struct Uniforms {
    v0: f32,
    v1: f32,
    _pad0: f32,
    _pad1: f32,
}

@group(0) @binding(0) var<uniform> u: Uniforms;
@group(0) @binding(1) var<storage, read> colors: array<vec4<f32>, 256>;

struct VertexOutput {
    @builtin(position) position: vec4<f32>,
    @location(0) texCoord: vec2<f32>,
}

@vertex fn vs_main(@builtin(vertex_index) vi: u32) -> VertexOutput {
    let corner = vec2<f32>(f32(vi & 1u), f32(vi >> 1u));

    var out: VertexOutput;
    out.position = vec4<f32>((corner * 2.0 - 1.0) * vec2<f32>(1.0, -1.0), 0.0, 1.0);
    out.texCoord = vec2<f32>(corner.x, mix(u.v0, u.v1, corner.y));
    return out;
}

@fragment fn fs_main(frag: VertexOutput) -> @location(0) vec4<f32> {
    let col = min(u32(floor(frag.texCoord.x * 16.0)), 15u);
    let row = min(u32(floor(frag.texCoord.y * 16.0)), 15u);
    if (col == 0u) {
        discard;
    }
    return colors[col + row * 16u];
}
)";

const char* PaletteRenderer::shaderSource() {
    return PALETTE_SHADER;
}

PaletteUniforms PaletteRenderer::uniformsFor(ViewedPalettes view) {
    PaletteViewMapping mapping = paletteViewMapping(view);
    PaletteUniforms uniforms;
    uniforms.v0 = mapping.v0;
    uniforms.v1 = mapping.v1;
    return uniforms;
}

Result<std::unique_ptr<PaletteRenderer>> PaletteRenderer::create(const GPUContext& gpu,
                                                                 GpuAllocator::Ptr allocator) {
    auto renderer = std::unique_ptr<PaletteRenderer>(new PaletteRenderer(gpu, std::move(allocator)));
    if (auto res = renderer->init(); !res) {
        return Err<std::unique_ptr<PaletteRenderer>>("Failed to init PaletteRenderer", res);
    }
    return Ok(std::move(renderer));
}

PaletteRenderer::PaletteRenderer(const GPUContext& gpu, GpuAllocator::Ptr allocator)
    : _gpu(gpu), _allocator(std::move(allocator)) {}

PaletteRenderer::~PaletteRenderer() {
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    if (_bindGroupLayout) wgpuBindGroupLayoutRelease(_bindGroupLayout);
    if (_pipeline) wgpuRenderPipelineRelease(_pipeline);
    if (_allocator) _allocator->releaseBuffer(_uniformBuffer);
}

Result<void> PaletteRenderer::init() {
    if (!_allocator) {
        return Err<void>("PaletteRenderer: null allocator");
    }

    auto moduleRes = compileShaderModule(_gpu.device, "palette shader", PALETTE_SHADER);
    if (!moduleRes) {
        return Err<void>("Failed to compile palette shader", moduleRes);
    }
    WGPUShaderModule shaderModule = *moduleRes;

    WGPUBindGroupLayoutEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Vertex;
    entries[0].buffer.type = WGPUBufferBindingType_Uniform;
    entries[0].buffer.minBindingSize = sizeof(PaletteUniforms);

    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;
    entries[1].buffer.minBindingSize = sizeof(ColorTableData);

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = 2;
    layoutDesc.entries = entries;
    _bindGroupLayout = wgpuDeviceCreateBindGroupLayout(_gpu.device, &layoutDesc);
    if (!_bindGroupLayout) {
        wgpuShaderModuleRelease(shaderModule);
        return Err<void>("Failed to create palette bind group layout");
    }

    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("palette uniforms");
    bufDesc.size = sizeof(PaletteUniforms);
    bufDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    _uniformBuffer = _allocator->createBuffer(bufDesc);
    if (!_uniformBuffer) {
        wgpuShaderModuleRelease(shaderModule);
        return Err<void>("Failed to create palette uniform buffer");
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &_bindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(_gpu.device, &pipelineLayoutDesc);

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
    pipelineDesc.label = WGPU_STR("palette pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
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
        return Err<void>("Failed to create palette pipeline");
    }

    yinfo("PaletteRenderer initialized");
    return Ok();
}

Result<void> PaletteRenderer::render(WGPURenderPassEncoder pass,
                                     const ColorTable& colors,
                                     ViewedPalettes view) {
    if (!pass) {
        return Err<void>("PaletteRenderer::render: null pass");
    }

    if (!_bindGroup || _boundColors != colors.buffer()) {
        if (_bindGroup) wgpuBindGroupRelease(_bindGroup);

        WGPUBindGroupEntry entries[2] = {};
        entries[0].binding = 0;
        entries[0].buffer = _uniformBuffer;
        entries[0].size = sizeof(PaletteUniforms);
        entries[1].binding = 1;
        entries[1].buffer = colors.buffer();
        entries[1].size = colors.byteSize();

        WGPUBindGroupDescriptor desc = {};
        desc.layout = _bindGroupLayout;
        desc.entryCount = 2;
        desc.entries = entries;
        _bindGroup = wgpuDeviceCreateBindGroup(_gpu.device, &desc);
        if (!_bindGroup) {
            _boundColors = nullptr;
            return Err<void>("Failed to create palette bind group");
        }
        _boundColors = colors.buffer();
    }

    PaletteUniforms uniforms = uniformsFor(view);
    wgpuQueueWriteBuffer(_gpu.queue, _uniformBuffer, 0, &uniforms, sizeof(uniforms));

    wgpuRenderPassEncoderSetPipeline(pass, _pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, _bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 4, 1, 0, 0);
    return Ok();
}

} // namespace ppuview
