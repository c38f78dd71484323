#pragma once

#include <rivvon/tile-texture-manager.h>
#include <rivvon/webgpu-context.h>
#include <webgpu/webgpu.h>
#include <memory>

namespace rivvon {

/**
 * One 2D-array texture per tile (array layers = animation layers), all
 * sampled through a single shared sampler.
 */
class WebGPUTileTextureManager : public TileTextureManager {
public:
    using Ptr = std::shared_ptr<WebGPUTileTextureManager>;

    static Result<Ptr> create(WebGPUContext::Ptr context) noexcept;

    virtual WGPUTextureView textureView(TextureId id) const = 0;
    virtual WGPUSampler sampler() const = 0;

    static WGPUTextureFormat toWGPUFormat(TileFormat format);

protected:
    WebGPUTileTextureManager() = default;
};

} // namespace rivvon
