#pragma once

#include <rivvon/mesh-buffer-manager.h>
#include <rivvon/webgpu-context.h>
#include <webgpu/webgpu.h>
#include <memory>
#include <optional>

namespace rivvon {

// Vertex + index buffer pair per segment
class WebGPUMeshBufferManager : public MeshBufferManager {
public:
    using Ptr = std::shared_ptr<WebGPUMeshBufferManager>;

    struct Buffers {
        WGPUBuffer vertexBuffer;
        WGPUBuffer indexBuffer;
        uint32_t vertexCount;
        uint32_t indexCount;
    };

    static Result<Ptr> create(WebGPUContext::Ptr context) noexcept;

    virtual std::optional<Buffers> buffers(MeshHandle handle) const = 0;

protected:
    WebGPUMeshBufferManager() = default;
};

} // namespace rivvon
