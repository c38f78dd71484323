#include <rivvon/webgpu-tile-texture-manager.h>
#include <rivvon/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <unordered_map>

namespace rivvon {

// =============================================================================
// Tile texture tracking data
// =============================================================================

struct TileTextureData {
    WGPUTexture texture = nullptr;
    WGPUTextureView view = nullptr;
    uint32_t layers = 0;
};

// =============================================================================
// WebGPUTileTextureManagerImpl
// =============================================================================

class WebGPUTileTextureManagerImpl : public WebGPUTileTextureManager {
public:
    explicit WebGPUTileTextureManagerImpl(WebGPUContext::Ptr context) noexcept
        : _context(std::move(context)), _device(_context->getDevice()), _queue(_context->getQueue()) {}
    ~WebGPUTileTextureManagerImpl() override;

    Result<void> init() noexcept;

    Result<TextureId> upload(const DecodedTile& tile) override;
    Result<void> release(TextureId id) override;
    bool supportsFormat(TileFormat format) const override;
    uint32_t liveTextureCount() const override { return static_cast<uint32_t>(_textures.size()); }

    WGPUTextureView textureView(TextureId id) const override;
    WGPUSampler sampler() const override { return _sampler; }

private:
    WebGPUContext::Ptr _context;
    WGPUDevice _device;
    WGPUQueue _queue;
    WGPUSampler _sampler = nullptr;

    std::unordered_map<uint32_t, TileTextureData> _textures;
    uint32_t _nextTextureId = 1;  // 0 = invalid
};

// =============================================================================
// Factory
// =============================================================================

Result<WebGPUTileTextureManager::Ptr> WebGPUTileTextureManager::create(WebGPUContext::Ptr context) noexcept {
    if (!context) {
        return Err<Ptr>(ErrorKind::State, "WebGPUTileTextureManager: no GPU context");
    }
    auto mgr = std::make_shared<WebGPUTileTextureManagerImpl>(std::move(context));
    if (auto res = mgr->init(); !res) {
        return Err<Ptr>("Failed to initialize WebGPUTileTextureManager", res);
    }
    return Ok(std::move(mgr));
}

WGPUTextureFormat WebGPUTileTextureManager::toWGPUFormat(TileFormat format) {
    switch (format) {
        case TileFormat::RGBA8Unorm:         return WGPUTextureFormat_RGBA8Unorm;
        case TileFormat::RGBA8UnormSrgb:     return WGPUTextureFormat_RGBA8UnormSrgb;
        case TileFormat::BC1RGBAUnorm:       return WGPUTextureFormat_BC1RGBAUnorm;
        case TileFormat::BC1RGBAUnormSrgb:   return WGPUTextureFormat_BC1RGBAUnormSrgb;
        case TileFormat::BC3RGBAUnorm:       return WGPUTextureFormat_BC3RGBAUnorm;
        case TileFormat::BC3RGBAUnormSrgb:   return WGPUTextureFormat_BC3RGBAUnormSrgb;
        case TileFormat::BC7RGBAUnorm:       return WGPUTextureFormat_BC7RGBAUnorm;
        case TileFormat::BC7RGBAUnormSrgb:   return WGPUTextureFormat_BC7RGBAUnormSrgb;
        case TileFormat::ETC2RGBA8Unorm:     return WGPUTextureFormat_ETC2RGBA8Unorm;
        case TileFormat::ETC2RGBA8UnormSrgb: return WGPUTextureFormat_ETC2RGBA8UnormSrgb;
        case TileFormat::ASTC4x4Unorm:       return WGPUTextureFormat_ASTC4x4Unorm;
        case TileFormat::ASTC4x4UnormSrgb:   return WGPUTextureFormat_ASTC4x4UnormSrgb;
    }
    return WGPUTextureFormat_Undefined;
}

// =============================================================================
// Implementation
// =============================================================================

Result<void> WebGPUTileTextureManagerImpl::init() noexcept {
    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.label = WGPU_STR("tile sampler");
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Linear;
    samplerDesc.mipmapFilter = WGPU_MIPMAP_FILTER_LINEAR;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 32.0f;
    samplerDesc.maxAnisotropy = 1;
    _sampler = wgpuDeviceCreateSampler(_device, &samplerDesc);
    if (!_sampler) {
        return Err(ErrorKind::Resource, "Failed to create tile sampler");
    }
    return Ok();
}

WebGPUTileTextureManagerImpl::~WebGPUTileTextureManagerImpl() {
    for (auto& [id, data] : _textures) {
        if (data.view) wgpuTextureViewRelease(data.view);
        if (data.texture) wgpuTextureRelease(data.texture);
    }
    if (_sampler) wgpuSamplerRelease(_sampler);
}

bool WebGPUTileTextureManagerImpl::supportsFormat(TileFormat format) const {
    switch (format) {
        case TileFormat::RGBA8Unorm:
        case TileFormat::RGBA8UnormSrgb:
            return true;
        case TileFormat::BC1RGBAUnorm:
        case TileFormat::BC1RGBAUnormSrgb:
        case TileFormat::BC3RGBAUnorm:
        case TileFormat::BC3RGBAUnormSrgb:
        case TileFormat::BC7RGBAUnorm:
        case TileFormat::BC7RGBAUnormSrgb:
            return _context->hasFeature(WGPUFeatureName_TextureCompressionBC);
        case TileFormat::ETC2RGBA8Unorm:
        case TileFormat::ETC2RGBA8UnormSrgb:
            return _context->hasFeature(WGPUFeatureName_TextureCompressionETC2);
        case TileFormat::ASTC4x4Unorm:
        case TileFormat::ASTC4x4UnormSrgb:
            return _context->hasFeature(WGPUFeatureName_TextureCompressionASTC);
    }
    return false;
}

Result<TextureId> WebGPUTileTextureManagerImpl::upload(const DecodedTile& tile) {
    if (tile.width == 0 || tile.height == 0 || tile.levels.empty()) {
        return Err<TextureId>(ErrorKind::Resource, "upload: empty tile");
    }
    const auto block = formatInfo(tile.format);
    const auto levelCount = static_cast<uint32_t>(tile.levels.size());

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("tile");
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.size = {tile.width, tile.height, tile.layers};
    texDesc.format = toWGPUFormat(tile.format);
    texDesc.mipLevelCount = levelCount;
    texDesc.sampleCount = 1;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;

    WGPUTexture texture = wgpuDeviceCreateTexture(_device, &texDesc);
    if (!texture) {
        return Err<TextureId>(ErrorKind::Resource, "upload: texture creation failed");
    }

    for (uint32_t level = 0; level < levelCount; ++level) {
        const auto& data = tile.levels[level];

        WGPUTexelCopyTextureInfo dst = {};
        dst.texture = texture;
        dst.mipLevel = level;
        dst.origin = {0, 0, 0};
        dst.aspect = WGPUTextureAspect_All;

        WGPUTexelCopyBufferLayout layout = {};
        layout.offset = 0;
        layout.bytesPerRow = tile.bytesPerRow(level);
        layout.rowsPerImage = tile.rowsPerImage(level);

        // compressed copies cover whole blocks
        WGPUExtent3D extent = {};
        extent.width = ((data.width + block.blockWidth - 1) / block.blockWidth) * block.blockWidth;
        extent.height = ((data.height + block.blockHeight - 1) / block.blockHeight) * block.blockHeight;
        extent.depthOrArrayLayers = tile.layers;

        wgpuQueueWriteTexture(_queue, &dst, data.data.data(), data.data.size(), &layout, &extent);
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = texDesc.format;
    viewDesc.dimension = WGPUTextureViewDimension_2DArray;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = levelCount;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = tile.layers;
    viewDesc.aspect = WGPUTextureAspect_All;

    WGPUTextureView view = wgpuTextureCreateView(texture, &viewDesc);
    if (!view) {
        wgpuTextureRelease(texture);
        return Err<TextureId>(ErrorKind::Resource, "upload: texture view creation failed");
    }

    uint32_t id = _nextTextureId++;
    _textures[id] = TileTextureData{texture, view, tile.layers};

    ydebug("WebGPUTileTextureManager: texture {} {}x{}x{} {} ({} levels)",
           id, tile.width, tile.height, tile.layers, toString(tile.format), levelCount);
    return Ok(TextureId{id});
}

Result<void> WebGPUTileTextureManagerImpl::release(TextureId id) {
    auto it = _textures.find(id.id);
    if (it == _textures.end()) {
        return Err("release: invalid texture id " + std::to_string(id.id));
    }
    if (it->second.view) wgpuTextureViewRelease(it->second.view);
    if (it->second.texture) wgpuTextureRelease(it->second.texture);
    _textures.erase(it);
    return Ok();
}

WGPUTextureView WebGPUTileTextureManagerImpl::textureView(TextureId id) const {
    auto it = _textures.find(id.id);
    return it == _textures.end() ? nullptr : it->second.view;
}

} // namespace rivvon
