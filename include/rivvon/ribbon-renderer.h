#pragma once

#include <rivvon/render-loop.h>
#include <rivvon/webgpu-context.h>
#include <rivvon/webgpu-mesh-buffer-manager.h>
#include <rivvon/webgpu-tile-texture-manager.h>
#include <webgpu/webgpu.h>
#include <glm/glm.hpp>
#include <memory>

namespace rivvon {

struct RibbonRendererConfig {
    float cameraDistance = 14.0f;
    float cameraElevation = 35.0f;  // degrees above the drawing plane
    float fovDegrees = 45.0f;
    glm::vec4 clearColor = {0.02f, 0.02f, 0.03f, 1.0f};
};

/**
 * RibbonRenderer draws every segment of a RibbonSeries with the material the
 * TileCache resolves for it.
 *
 * Single-tile materials sample one tile at the current layer; flow materials
 * sample the current tile and its successor and pick between them by
 * uv.x + flowOffset, so the strip scrolls one tile per unit of flow offset.
 */
class RibbonRenderer : public FrameRenderer {
public:
    using Config = RibbonRendererConfig;
    using Ptr = std::shared_ptr<RibbonRenderer>;

    static Result<Ptr> create(WebGPUContext::Ptr context,
                              WebGPUTileTextureManager::Ptr textures,
                              WebGPUMeshBufferManager::Ptr meshes,
                              Config config = {}) noexcept;

    ~RibbonRenderer() override = default;

    // Draw into an arbitrary view of targetFormat() (offscreen capture)
    virtual Result<void> renderTo(WGPUTextureView target, uint32_t width, uint32_t height,
                                  const RibbonSeries& series, const TileCache& cache) = 0;

    virtual WGPUTextureFormat targetFormat() const = 0;

    // Drop cached bind groups (tile set replaced)
    virtual void invalidateBindings() = 0;

    virtual void setConfig(const Config& config) = 0;
    virtual const Config& config() const = 0;

    // view-projection matrix for a target of the given size
    static glm::mat4 viewProjection(const Config& config, uint32_t width, uint32_t height);

protected:
    RibbonRenderer() = default;
};

} // namespace rivvon
