#include <rivvon/ribbon-renderer.h>
#include <rivvon/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>

namespace rivvon {

// =============================================================================
// Shader
// =============================================================================

static const char* RIBBON_SHADER = R"(
struct Uniforms {
    viewProj: mat4x4<f32>,
    layer: u32,
    rotate90: u32,
    flowOffset: f32,
    _pad: u32,
};

@group(0) @binding(0) var<uniform> u: Uniforms;

@group(1) @binding(0) var texCurrent: texture_2d_array<f32>;
@group(1) @binding(1) var texNext: texture_2d_array<f32>;
@group(1) @binding(2) var tileSampler: sampler;

struct VertexInput {
    @location(0) position: vec3<f32>,
    @location(1) normal: vec3<f32>,
    @location(2) uv: vec2<f32>,
};

struct VertexOutput {
    @builtin(position) position: vec4<f32>,
    @location(0) uv: vec2<f32>,
    @location(1) normal: vec3<f32>,
};

@vertex
fn vs_main(in: VertexInput) -> VertexOutput {
    var out: VertexOutput;
    out.position = u.viewProj * vec4<f32>(in.position, 1.0);
    out.uv = in.uv;
    out.normal = in.normal;
    return out;
}

// tiles are authored sideways when rotate90 is set
fn tileUv(uv: vec2<f32>) -> vec2<f32> {
    if (u.rotate90 != 0u) {
        return vec2<f32>(uv.y, 1.0 - uv.x);
    }
    return vec2<f32>(uv.x, 1.0 - uv.y);
}

fn sampleTile(tex: texture_2d_array<f32>, uv: vec2<f32>) -> vec4<f32> {
    let layer = min(u.layer, textureNumLayers(tex) - 1u);
    return textureSample(tex, tileSampler, tileUv(uv), layer);
}

fn shade(color: vec4<f32>, normal: vec3<f32>) -> vec4<f32> {
    let light = normalize(vec3<f32>(0.3, 0.8, 0.5));
    let lambert = 0.7 + 0.3 * abs(dot(normalize(normal), light));
    return vec4<f32>(color.rgb * lambert, color.a);
}

@fragment
fn fs_single(in: VertexOutput) -> @location(0) vec4<f32> {
    return shade(sampleTile(texCurrent, in.uv), in.normal);
}

@fragment
fn fs_flow(in: VertexOutput) -> @location(0) vec4<f32> {
    let shifted = in.uv.x + u.flowOffset;
    let current = sampleTile(texCurrent, vec2<f32>(fract(shifted), in.uv.y));
    let next = sampleTile(texNext, vec2<f32>(fract(shifted), in.uv.y));
    return shade(select(current, next, shifted >= 1.0), in.normal);
}
)";

static constexpr WGPUTextureFormat DEPTH_FORMAT = WGPUTextureFormat_Depth24Plus;

// Matches Uniforms in RIBBON_SHADER
struct RibbonUniforms {
    float viewProj[16];
    uint32_t layer;
    uint32_t rotate90;
    float flowOffset;
    uint32_t _pad;
};
static_assert(sizeof(RibbonUniforms) == 80, "RibbonUniforms must match the WGSL layout");

// =============================================================================
// RibbonRendererImpl
// =============================================================================

class RibbonRendererImpl : public RibbonRenderer {
public:
    RibbonRendererImpl(WebGPUContext::Ptr context,
                       WebGPUTileTextureManager::Ptr textures,
                       WebGPUMeshBufferManager::Ptr meshes,
                       Config config) noexcept
        : _ctx(std::move(context))
        , _textures(std::move(textures))
        , _meshes(std::move(meshes))
        , _config(config) {}

    ~RibbonRendererImpl() override;

    Result<void> init() noexcept;

    Result<void> drawFrame(const RibbonSeries& series, const TileCache& cache) override;
    Result<void> renderTo(WGPUTextureView target, uint32_t width, uint32_t height,
                          const RibbonSeries& series, const TileCache& cache) override;

    WGPUTextureFormat targetFormat() const override { return _ctx->getSurfaceFormat(); }
    void invalidateBindings() override;
    void setConfig(const Config& config) override { _config = config; }
    const Config& config() const override { return _config; }

private:
    Result<void> createPipelines() noexcept;
    Result<WGPURenderPipeline> createPipeline(const char* fragmentEntry) noexcept;
    Result<void> ensureDepthTexture(uint32_t width, uint32_t height) noexcept;
    Result<WGPUBindGroup> bindGroupFor(MaterialHandle material, const MaterialKind& kind,
                                       const TileCache& cache);
    void releaseUnusedBindGroups(const std::unordered_set<uint32_t>& used);

    WebGPUContext::Ptr _ctx;
    WebGPUTileTextureManager::Ptr _textures;
    WebGPUMeshBufferManager::Ptr _meshes;
    Config _config;

    WGPUShaderModule _shaderModule = nullptr;
    WGPUBindGroupLayout _frameLayout = nullptr;
    WGPUBindGroupLayout _materialLayout = nullptr;
    WGPUPipelineLayout _pipelineLayout = nullptr;
    WGPURenderPipeline _singlePipeline = nullptr;
    WGPURenderPipeline _flowPipeline = nullptr;
    WGPUBuffer _uniformBuffer = nullptr;
    WGPUBindGroup _frameBindGroup = nullptr;

    WGPUTexture _depthTexture = nullptr;
    WGPUTextureView _depthView = nullptr;
    uint32_t _depthWidth = 0;
    uint32_t _depthHeight = 0;

    // material id -> bind group, valid for _boundCache only
    std::unordered_map<uint32_t, WGPUBindGroup> _bindGroups;
    const TileCache* _boundCache = nullptr;
};

// =============================================================================
// Factory
// =============================================================================

Result<RibbonRenderer::Ptr> RibbonRenderer::create(WebGPUContext::Ptr context,
                                                   WebGPUTileTextureManager::Ptr textures,
                                                   WebGPUMeshBufferManager::Ptr meshes,
                                                   Config config) noexcept {
    if (!context || !textures || !meshes) {
        return Err<Ptr>(ErrorKind::State, "RibbonRenderer: missing GPU collaborators");
    }
    auto renderer = std::make_shared<RibbonRendererImpl>(std::move(context), std::move(textures),
                                                         std::move(meshes), config);
    if (auto res = renderer->init(); !res) {
        return Err<Ptr>("Failed to initialize RibbonRenderer", res);
    }
    return Ok(std::move(renderer));
}

glm::mat4 RibbonRenderer::viewProjection(const Config& config, uint32_t width, uint32_t height) {
    float aspect = height > 0 ? static_cast<float>(width) / static_cast<float>(height) : 1.0f;
    float elevation = glm::radians(config.cameraElevation);
    glm::vec3 eye(0.0f,
                  std::sin(elevation) * config.cameraDistance,
                  std::cos(elevation) * config.cameraDistance);
    glm::mat4 view = glm::lookAt(eye, glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    glm::mat4 proj = glm::perspective(glm::radians(config.fovDegrees), aspect, 0.1f, 200.0f);
    return proj * view;
}

// =============================================================================
// Setup
// =============================================================================

Result<void> RibbonRendererImpl::init() noexcept {
    if (auto res = createPipelines(); !res) {
        return Err("RibbonRenderer: failed to create pipelines", res);
    }
    yinfo("RibbonRenderer: initialized (target {})", static_cast<int>(targetFormat()));
    return Ok();
}

RibbonRendererImpl::~RibbonRendererImpl() {
    invalidateBindings();
    if (_depthView) wgpuTextureViewRelease(_depthView);
    if (_depthTexture) wgpuTextureRelease(_depthTexture);
    if (_frameBindGroup) wgpuBindGroupRelease(_frameBindGroup);
    if (_uniformBuffer) wgpuBufferRelease(_uniformBuffer);
    if (_flowPipeline) wgpuRenderPipelineRelease(_flowPipeline);
    if (_singlePipeline) wgpuRenderPipelineRelease(_singlePipeline);
    if (_pipelineLayout) wgpuPipelineLayoutRelease(_pipelineLayout);
    if (_materialLayout) wgpuBindGroupLayoutRelease(_materialLayout);
    if (_frameLayout) wgpuBindGroupLayoutRelease(_frameLayout);
    if (_shaderModule) wgpuShaderModuleRelease(_shaderModule);
}

Result<void> RibbonRendererImpl::createPipelines() noexcept {
    WGPUDevice device = _ctx->getDevice();

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = WGPU_STR(RIBBON_SHADER);
    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    _shaderModule = wgpuDeviceCreateShaderModule(device, &shaderDesc);
    if (!_shaderModule) return Err("Failed to create ribbon shader module");

    // Uniform buffer
    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("ribbon uniforms");
    bufDesc.size = sizeof(RibbonUniforms);
    bufDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    _uniformBuffer = wgpuDeviceCreateBuffer(device, &bufDesc);
    if (!_uniformBuffer) return Err("Failed to create uniform buffer");

    // Group 0: per frame
    WGPUBindGroupLayoutEntry frameEntry = {};
    frameEntry.binding = 0;
    frameEntry.visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    frameEntry.buffer.type = WGPUBufferBindingType_Uniform;
    frameEntry.buffer.minBindingSize = sizeof(RibbonUniforms);

    WGPUBindGroupLayoutDescriptor frameLayoutDesc = {};
    frameLayoutDesc.entryCount = 1;
    frameLayoutDesc.entries = &frameEntry;
    _frameLayout = wgpuDeviceCreateBindGroupLayout(device, &frameLayoutDesc);
    if (!_frameLayout) return Err("Failed to create frame bind group layout");

    // Group 1: per material
    WGPUBindGroupLayoutEntry materialEntries[3] = {};

    materialEntries[0].binding = 0;
    materialEntries[0].visibility = WGPUShaderStage_Fragment;
    materialEntries[0].texture.sampleType = WGPUTextureSampleType_Float;
    materialEntries[0].texture.viewDimension = WGPUTextureViewDimension_2DArray;

    materialEntries[1].binding = 1;
    materialEntries[1].visibility = WGPUShaderStage_Fragment;
    materialEntries[1].texture.sampleType = WGPUTextureSampleType_Float;
    materialEntries[1].texture.viewDimension = WGPUTextureViewDimension_2DArray;

    materialEntries[2].binding = 2;
    materialEntries[2].visibility = WGPUShaderStage_Fragment;
    materialEntries[2].sampler.type = WGPUSamplerBindingType_Filtering;

    WGPUBindGroupLayoutDescriptor materialLayoutDesc = {};
    materialLayoutDesc.entryCount = 3;
    materialLayoutDesc.entries = materialEntries;
    _materialLayout = wgpuDeviceCreateBindGroupLayout(device, &materialLayoutDesc);
    if (!_materialLayout) return Err("Failed to create material bind group layout");

    WGPUBindGroupEntry frameBinding = {};
    frameBinding.binding = 0;
    frameBinding.buffer = _uniformBuffer;
    frameBinding.size = sizeof(RibbonUniforms);

    WGPUBindGroupDescriptor frameBgDesc = {};
    frameBgDesc.layout = _frameLayout;
    frameBgDesc.entryCount = 1;
    frameBgDesc.entries = &frameBinding;
    _frameBindGroup = wgpuDeviceCreateBindGroup(device, &frameBgDesc);
    if (!_frameBindGroup) return Err("Failed to create frame bind group");

    WGPUBindGroupLayout layouts[2] = {_frameLayout, _materialLayout};
    WGPUPipelineLayoutDescriptor plDesc = {};
    plDesc.bindGroupLayoutCount = 2;
    plDesc.bindGroupLayouts = layouts;
    _pipelineLayout = wgpuDeviceCreatePipelineLayout(device, &plDesc);
    if (!_pipelineLayout) return Err("Failed to create pipeline layout");

    auto single = createPipeline("fs_single");
    if (!single) return Err("single-tile pipeline", single);
    _singlePipeline = *single;

    auto flow = createPipeline("fs_flow");
    if (!flow) return Err("flow pipeline", flow);
    _flowPipeline = *flow;

    return Ok();
}

Result<WGPURenderPipeline> RibbonRendererImpl::createPipeline(const char* fragmentEntry) noexcept {
    // RibbonVertex: position, normal, uv
    WGPUVertexAttribute attrs[3] = {};
    attrs[0].format = WGPUVertexFormat_Float32x3;
    attrs[0].offset = offsetof(RibbonVertex, position);
    attrs[0].shaderLocation = 0;
    attrs[1].format = WGPUVertexFormat_Float32x3;
    attrs[1].offset = offsetof(RibbonVertex, normal);
    attrs[1].shaderLocation = 1;
    attrs[2].format = WGPUVertexFormat_Float32x2;
    attrs[2].offset = offsetof(RibbonVertex, uv);
    attrs[2].shaderLocation = 2;

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = sizeof(RibbonVertex);
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = 3;
    vertexLayout.attributes = attrs;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = WGPU_STR(fragmentEntry);
    pipelineDesc.layout = _pipelineLayout;

    pipelineDesc.vertex.module = _shaderModule;
    pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
    pipelineDesc.vertex.bufferCount = 1;
    pipelineDesc.vertex.buffers = &vertexLayout;

    WGPUBlendState blend = {};
    blend.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blend.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blend.color.operation = WGPUBlendOperation_Add;
    blend.alpha.srcFactor = WGPUBlendFactor_One;
    blend.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blend.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = targetFormat();
    colorTarget.blend = &blend;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragState = {};
    fragState.module = _shaderModule;
    fragState.entryPoint = WGPU_STR(fragmentEntry);
    fragState.targetCount = 1;
    fragState.targets = &colorTarget;
    pipelineDesc.fragment = &fragState;

    WGPUDepthStencilState depthState = {};
    depthState.format = DEPTH_FORMAT;
    depthState.depthWriteEnabled = WGPUOptionalBool_True;
    depthState.depthCompare = WGPUCompareFunction_Less;
    depthState.stencilFront.compare = WGPUCompareFunction_Always;
    depthState.stencilBack.compare = WGPUCompareFunction_Always;
    pipelineDesc.depthStencil = &depthState;

    // ribbons are two-sided
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;

    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = 0xFFFFFFFF;

    WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(_ctx->getDevice(), &pipelineDesc);
    if (!pipeline) {
        return Err<WGPURenderPipeline>("Failed to create render pipeline " + std::string(fragmentEntry));
    }
    return Ok(pipeline);
}

Result<void> RibbonRendererImpl::ensureDepthTexture(uint32_t width, uint32_t height) noexcept {
    if (_depthTexture && _depthWidth == width && _depthHeight == height) {
        return Ok();
    }
    if (_depthView) wgpuTextureViewRelease(_depthView);
    if (_depthTexture) wgpuTextureRelease(_depthTexture);
    _depthView = nullptr;
    _depthTexture = nullptr;

    WGPUTextureDescriptor desc = {};
    desc.label = WGPU_STR("ribbon depth");
    desc.dimension = WGPUTextureDimension_2D;
    desc.size = {width, height, 1};
    desc.format = DEPTH_FORMAT;
    desc.mipLevelCount = 1;
    desc.sampleCount = 1;
    desc.usage = WGPUTextureUsage_RenderAttachment;
    _depthTexture = wgpuDeviceCreateTexture(_ctx->getDevice(), &desc);
    if (!_depthTexture) {
        return Err(ErrorKind::Resource, "Failed to create depth texture");
    }
    _depthView = wgpuTextureCreateView(_depthTexture, nullptr);
    if (!_depthView) {
        return Err(ErrorKind::Resource, "Failed to create depth view");
    }
    _depthWidth = width;
    _depthHeight = height;
    return Ok();
}

// =============================================================================
// Bind groups
// =============================================================================

void RibbonRendererImpl::invalidateBindings() {
    for (auto& [id, bindGroup] : _bindGroups) {
        wgpuBindGroupRelease(bindGroup);
    }
    _bindGroups.clear();
    _boundCache = nullptr;
}

void RibbonRendererImpl::releaseUnusedBindGroups(const std::unordered_set<uint32_t>& used) {
    for (auto it = _bindGroups.begin(); it != _bindGroups.end();) {
        if (used.contains(it->first)) {
            ++it;
        } else {
            wgpuBindGroupRelease(it->second);
            it = _bindGroups.erase(it);
        }
    }
}

Result<WGPUBindGroup> RibbonRendererImpl::bindGroupFor(MaterialHandle material, const MaterialKind& kind,
                                                       const TileCache& cache) {
    if (auto it = _bindGroups.find(material.id); it != _bindGroups.end()) {
        return Ok(it->second);
    }

    auto [currentTile, nextTile] = std::visit(
        [](const auto& m) -> std::pair<uint32_t, uint32_t> {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, FlowTileMaterial>) {
                return {m.currentTile, m.nextTile};
            } else {
                return {m.tile, m.tile};
            }
        },
        kind);

    WGPUTextureView currentView = _textures->textureView(cache.tileTexture(currentTile));
    WGPUTextureView nextView = _textures->textureView(cache.tileTexture(nextTile));
    if (!currentView || !nextView) {
        return Err<WGPUBindGroup>(ErrorKind::State,
                                  "RibbonRenderer: no texture for material " + std::to_string(material.id));
    }

    WGPUBindGroupEntry entries[3] = {};
    entries[0].binding = 0;
    entries[0].textureView = currentView;
    entries[1].binding = 1;
    entries[1].textureView = nextView;
    entries[2].binding = 2;
    entries[2].sampler = _textures->sampler();

    WGPUBindGroupDescriptor desc = {};
    desc.layout = _materialLayout;
    desc.entryCount = 3;
    desc.entries = entries;
    WGPUBindGroup bindGroup = wgpuDeviceCreateBindGroup(_ctx->getDevice(), &desc);
    if (!bindGroup) {
        return Err<WGPUBindGroup>(ErrorKind::Resource, "Failed to create material bind group");
    }
    _bindGroups[material.id] = bindGroup;
    return Ok(bindGroup);
}

// =============================================================================
// Drawing
// =============================================================================

Result<void> RibbonRendererImpl::drawFrame(const RibbonSeries& series, const TileCache& cache) {
    auto view = _ctx->getCurrentTextureView();
    if (!view) {
        return Err("RibbonRenderer: no surface texture", view);
    }
    auto res = renderTo(*view, _ctx->width(), _ctx->height(), series, cache);
    _ctx->present();
    return res;
}

Result<void> RibbonRendererImpl::renderTo(WGPUTextureView target, uint32_t width, uint32_t height,
                                          const RibbonSeries& series, const TileCache& cache) {
    if (cache.lifecycleState() != LifecycleState::Ready) {
        return Err(ErrorKind::State, "RibbonRenderer: tile cache not ready");
    }
    if (&cache != _boundCache) {
        invalidateBindings();
        _boundCache = &cache;
    }
    if (auto res = ensureDepthTexture(width, height); !res) {
        return res;
    }

    RibbonUniforms uniforms = {};
    glm::mat4 viewProj = viewProjection(_config, width, height);
    std::memcpy(uniforms.viewProj, glm::value_ptr(viewProj), sizeof(uniforms.viewProj));
    uniforms.layer = cache.currentLayer();
    uniforms.rotate90 = cache.rotate90() ? 1u : 0u;
    uniforms.flowOffset = static_cast<float>(cache.flowOffset());
    wgpuQueueWriteBuffer(_ctx->getQueue(), _uniformBuffer, 0, &uniforms, sizeof(uniforms));

    WGPUDevice device = _ctx->getDevice();
    WGPUCommandEncoderDescriptor encoderDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device, &encoderDesc);
    if (!encoder) {
        return Err(ErrorKind::Resource, "RibbonRenderer: failed to create command encoder");
    }

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    WGPU_COLOR_ATTACHMENT_CLEAR(colorAttachment, _config.clearColor.r, _config.clearColor.g,
                                _config.clearColor.b, _config.clearColor.a);

    WGPURenderPassDepthStencilAttachment depthAttachment = {};
    depthAttachment.view = _depthView;
    depthAttachment.depthLoadOp = WGPULoadOp_Clear;
    depthAttachment.depthStoreOp = WGPUStoreOp_Discard;
    depthAttachment.depthClearValue = 1.0f;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;
    passDesc.depthStencilAttachment = &depthAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    if (!pass) {
        wgpuCommandEncoderRelease(encoder);
        return Err(ErrorKind::Resource, "RibbonRenderer: failed to begin render pass");
    }
    wgpuRenderPassEncoderSetBindGroup(pass, 0, _frameBindGroup, 0, nullptr);

    std::unordered_set<uint32_t> used;
    WGPURenderPipeline bound = nullptr;
    uint32_t drawn = 0;

    for (const auto& ribbon : series.ribbons()) {
        for (const auto& seg : ribbon->segments()) {
            auto kind = cache.resolve(seg.material);
            auto buffers = _meshes->buffers(seg.mesh);
            if (!kind || !buffers) {
                ytrace("RibbonRenderer: segment {} has no material or mesh", seg.globalIndex);
                continue;
            }
            auto bindGroup = bindGroupFor(seg.material, *kind, cache);
            if (!bindGroup) {
                ywarn("RibbonRenderer: {}", bindGroup.error().to_string());
                continue;
            }
            used.insert(seg.material.id);

            WGPURenderPipeline pipeline = isFlowMaterial(*kind) ? _flowPipeline : _singlePipeline;
            if (pipeline != bound) {
                wgpuRenderPassEncoderSetPipeline(pass, pipeline);
                bound = pipeline;
            }
            wgpuRenderPassEncoderSetBindGroup(pass, 1, *bindGroup, 0, nullptr);
            wgpuRenderPassEncoderSetVertexBuffer(pass, 0, buffers->vertexBuffer, 0,
                                                 buffers->vertexCount * sizeof(RibbonVertex));
            wgpuRenderPassEncoderSetIndexBuffer(pass, buffers->indexBuffer, WGPUIndexFormat_Uint32, 0,
                                                buffers->indexCount * sizeof(uint32_t));
            wgpuRenderPassEncoderDrawIndexed(pass, buffers->indexCount, 1, 0, 0, 0);
            ++drawn;
        }
    }

    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    if (!cmdBuffer) {
        wgpuCommandEncoderRelease(encoder);
        return Err(ErrorKind::Resource, "RibbonRenderer: failed to finish command encoder");
    }
    wgpuQueueSubmit(_ctx->getQueue(), 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    // flow swaps recreate materials; bind groups of dropped ids go with them
    releaseUnusedBindGroups(used);

    ytrace("RibbonRenderer: drew {} segments, layer {}, flow {:.3f}", drawn, uniforms.layer, uniforms.flowOffset);
    return Ok();
}

} // namespace rivvon
