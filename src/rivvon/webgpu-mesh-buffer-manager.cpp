#include <rivvon/webgpu-mesh-buffer-manager.h>
#include <rivvon/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <unordered_map>

namespace rivvon {

class WebGPUMeshBufferManagerImpl : public WebGPUMeshBufferManager {
public:
    explicit WebGPUMeshBufferManagerImpl(WebGPUContext::Ptr context) noexcept
        : _context(std::move(context)), _device(_context->getDevice()), _queue(_context->getQueue()) {}

    ~WebGPUMeshBufferManagerImpl() override {
        for (auto& [id, buffers] : _meshes) {
            wgpuBufferRelease(buffers.vertexBuffer);
            wgpuBufferRelease(buffers.indexBuffer);
        }
    }

    Result<MeshHandle> allocate(uint32_t vertexCount, uint32_t indexCount) override {
        if (vertexCount == 0 || indexCount == 0) {
            return Err<MeshHandle>("allocate: empty mesh");
        }

        WGPUBufferDescriptor vbDesc = {};
        vbDesc.label = WGPU_STR("segment vertices");
        vbDesc.size = static_cast<uint64_t>(vertexCount) * sizeof(RibbonVertex);
        vbDesc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
        WGPUBuffer vertexBuffer = wgpuDeviceCreateBuffer(_device, &vbDesc);
        if (!vertexBuffer) {
            return Err<MeshHandle>(ErrorKind::Resource, "allocate: vertex buffer creation failed");
        }

        WGPUBufferDescriptor ibDesc = {};
        ibDesc.label = WGPU_STR("segment indices");
        ibDesc.size = static_cast<uint64_t>(indexCount) * sizeof(uint32_t);
        ibDesc.usage = WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst;
        WGPUBuffer indexBuffer = wgpuDeviceCreateBuffer(_device, &ibDesc);
        if (!indexBuffer) {
            wgpuBufferRelease(vertexBuffer);
            return Err<MeshHandle>(ErrorKind::Resource, "allocate: index buffer creation failed");
        }

        uint32_t id = _nextMeshId++;
        _meshes[id] = Buffers{vertexBuffer, indexBuffer, vertexCount, indexCount};
        return Ok(MeshHandle{id});
    }

    Result<void> write(MeshHandle handle,
                       const std::vector<RibbonVertex>& vertices,
                       const std::vector<uint32_t>& indices) override {
        if (auto res = writeVertices(handle, vertices); !res) {
            return res;
        }
        const auto& buffers = _meshes.at(handle.id);
        if (indices.size() != buffers.indexCount) {
            return Err("write: index count mismatch");
        }
        wgpuQueueWriteBuffer(_queue, buffers.indexBuffer, 0, indices.data(), indices.size() * sizeof(uint32_t));
        return Ok();
    }

    Result<void> writeVertices(MeshHandle handle, const std::vector<RibbonVertex>& vertices) override {
        auto it = _meshes.find(handle.id);
        if (it == _meshes.end()) {
            return Err("writeVertices: invalid mesh handle " + std::to_string(handle.id));
        }
        if (vertices.size() != it->second.vertexCount) {
            return Err("writeVertices: vertex count mismatch");
        }
        wgpuQueueWriteBuffer(_queue, it->second.vertexBuffer, 0, vertices.data(),
                             vertices.size() * sizeof(RibbonVertex));
        return Ok();
    }

    Result<void> release(MeshHandle handle) override {
        auto it = _meshes.find(handle.id);
        if (it == _meshes.end()) {
            return Err("release: invalid mesh handle " + std::to_string(handle.id));
        }
        wgpuBufferRelease(it->second.vertexBuffer);
        wgpuBufferRelease(it->second.indexBuffer);
        _meshes.erase(it);
        return Ok();
    }

    uint32_t liveMeshCount() const override { return static_cast<uint32_t>(_meshes.size()); }

    std::optional<Buffers> buffers(MeshHandle handle) const override {
        auto it = _meshes.find(handle.id);
        if (it == _meshes.end()) return std::nullopt;
        return it->second;
    }

private:
    WebGPUContext::Ptr _context;
    WGPUDevice _device;
    WGPUQueue _queue;

    std::unordered_map<uint32_t, Buffers> _meshes;
    uint32_t _nextMeshId = 1;  // 0 = invalid
};

Result<WebGPUMeshBufferManager::Ptr> WebGPUMeshBufferManager::create(WebGPUContext::Ptr context) noexcept {
    if (!context) {
        return Err<Ptr>(ErrorKind::State, "WebGPUMeshBufferManager: no GPU context");
    }
    return Ok(std::make_shared<WebGPUMeshBufferManagerImpl>(std::move(context)));
}

} // namespace rivvon
