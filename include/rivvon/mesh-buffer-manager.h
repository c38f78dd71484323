#pragma once

#include <rivvon/result.hpp>
#include <rivvon/types.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace rivvon {

// Opaque handle to one segment's vertex/index buffers
struct MeshHandle {
    uint32_t id;

    bool isValid() const { return id != 0; }
    static MeshHandle invalid() { return {0}; }
    bool operator==(const MeshHandle&) const = default;
};

/**
 * MeshBufferManager owns segment geometry on the GPU.
 *
 * A mesh is allocated with fixed vertex/index capacity; write() replaces its
 * contents in place (wave animation rewrites vertices every frame).
 */
class MeshBufferManager {
public:
    using Ptr = std::shared_ptr<MeshBufferManager>;

    virtual ~MeshBufferManager() = default;

    virtual Result<MeshHandle> allocate(uint32_t vertexCount, uint32_t indexCount) = 0;
    virtual Result<void> write(MeshHandle handle,
                               const std::vector<RibbonVertex>& vertices,
                               const std::vector<uint32_t>& indices) = 0;
    virtual Result<void> writeVertices(MeshHandle handle,
                                       const std::vector<RibbonVertex>& vertices) = 0;
    virtual Result<void> release(MeshHandle handle) = 0;

    virtual uint32_t liveMeshCount() const = 0;

protected:
    MeshBufferManager() = default;
};

} // namespace rivvon
