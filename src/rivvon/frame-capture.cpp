#include <rivvon/frame-capture.h>
#include <rivvon/frame-encoding.h>
#include <rivvon/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <atomic>

namespace rivvon {

class FrameCaptureImpl : public FrameCapture {
public:
    FrameCaptureImpl(WebGPUContext::Ptr context, RibbonRenderer::Ptr renderer) noexcept
        : _ctx(std::move(context)), _renderer(std::move(renderer)) {}
    ~FrameCaptureImpl() override { releaseTarget(); }

    Result<std::vector<uint8_t>> readPixels(const RibbonSeries& series, const TileCache& cache,
                                            uint32_t width, uint32_t height) override;
    Result<std::vector<uint8_t>> captureFrame(const RibbonSeries& series, const TileCache& cache,
                                              uint32_t width, uint32_t height) override;

private:
    Result<void> ensureTarget(uint32_t width, uint32_t height) noexcept;
    void releaseTarget();

    WebGPUContext::Ptr _ctx;
    RibbonRenderer::Ptr _renderer;

    WGPUTexture _target = nullptr;
    WGPUTextureView _targetView = nullptr;
    WGPUBuffer _readback = nullptr;
    uint32_t _width = 0;
    uint32_t _height = 0;
    uint32_t _alignedBytesPerRow = 0;
};

Result<FrameCapture::Ptr> FrameCapture::create(WebGPUContext::Ptr context, RibbonRenderer::Ptr renderer) noexcept {
    if (!context || !renderer) {
        return Err<Ptr>(ErrorKind::State, "FrameCapture: missing context or renderer");
    }
    return Ok(std::make_shared<FrameCaptureImpl>(std::move(context), std::move(renderer)));
}

void FrameCaptureImpl::releaseTarget() {
    if (_targetView) wgpuTextureViewRelease(_targetView);
    if (_target) wgpuTextureRelease(_target);
    if (_readback) wgpuBufferRelease(_readback);
    _targetView = nullptr;
    _target = nullptr;
    _readback = nullptr;
    _width = 0;
    _height = 0;
}

Result<void> FrameCaptureImpl::ensureTarget(uint32_t width, uint32_t height) noexcept {
    if (_target && _width == width && _height == height) {
        return Ok();
    }
    releaseTarget();

    WGPUDevice device = _ctx->getDevice();

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("capture target");
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.size = {width, height, 1};
    texDesc.format = _renderer->targetFormat();
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_CopySrc;
    _target = wgpuDeviceCreateTexture(device, &texDesc);
    if (!_target) {
        return Err(ErrorKind::Resource, "FrameCapture: failed to create capture texture");
    }
    _targetView = wgpuTextureCreateView(_target, nullptr);
    if (!_targetView) {
        releaseTarget();
        return Err(ErrorKind::Resource, "FrameCapture: failed to create capture view");
    }

    // copies need 256-byte aligned rows
    _alignedBytesPerRow = (width * 4 + 255) & ~255u;
    WGPUBufferDescriptor bufDesc = {};
    bufDesc.label = WGPU_STR("capture readback");
    bufDesc.size = static_cast<uint64_t>(_alignedBytesPerRow) * height;
    bufDesc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
    _readback = wgpuDeviceCreateBuffer(device, &bufDesc);
    if (!_readback) {
        releaseTarget();
        return Err(ErrorKind::Resource, "FrameCapture: failed to create readback buffer");
    }

    _width = width;
    _height = height;
    return Ok();
}

Result<std::vector<uint8_t>> FrameCaptureImpl::readPixels(const RibbonSeries& series, const TileCache& cache,
                                                          uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return Err<std::vector<uint8_t>>(ErrorKind::Construction, "FrameCapture: empty capture size");
    }
    WGPUTextureFormat format = _renderer->targetFormat();
    bool bgra = format == WGPUTextureFormat_BGRA8Unorm || format == WGPUTextureFormat_BGRA8UnormSrgb;
    bool rgba = format == WGPUTextureFormat_RGBA8Unorm || format == WGPUTextureFormat_RGBA8UnormSrgb;
    if (!bgra && !rgba) {
        return Err<std::vector<uint8_t>>(ErrorKind::Resource, "FrameCapture: unsupported target format " +
                                                                  std::to_string(static_cast<int>(format)));
    }

    if (auto res = ensureTarget(width, height); !res) {
        return Err<std::vector<uint8_t>>("FrameCapture: target", res);
    }
    if (auto res = _renderer->renderTo(_targetView, width, height, series, cache); !res) {
        return Err<std::vector<uint8_t>>("FrameCapture: render", res);
    }

    WGPUDevice device = _ctx->getDevice();
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device, nullptr);
    WGPUTexelCopyTextureInfo src = {};
    src.texture = _target;
    WGPUTexelCopyBufferInfo dst = {};
    dst.buffer = _readback;
    dst.layout.bytesPerRow = _alignedBytesPerRow;
    dst.layout.rowsPerImage = height;
    WGPUExtent3D copySize = {width, height, 1};
    wgpuCommandEncoderCopyTextureToBuffer(encoder, &src, &dst, &copySize);
    WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuQueueSubmit(_ctx->getQueue(), 1, &cmd);
    wgpuCommandBufferRelease(cmd);
    wgpuCommandEncoderRelease(encoder);

    const uint64_t bufSize = static_cast<uint64_t>(_alignedBytesPerRow) * height;
    std::atomic<bool> done{false};
    WGPUMapAsyncStatus status = WGPUMapAsyncStatus_Success;
    WGPUBufferMapCallbackInfo cbInfo = {};
    cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    cbInfo.callback = [](WGPUMapAsyncStatus s, WGPUStringView, void* ud1, void* ud2) {
        // status before done: the wait loop reads status once done is seen
        *static_cast<WGPUMapAsyncStatus*>(ud2) = s;
        static_cast<std::atomic<bool>*>(ud1)->store(true, std::memory_order_release);
    };
    cbInfo.userdata1 = &done;
    cbInfo.userdata2 = &status;
    wgpuBufferMapAsync(_readback, WGPUMapMode_Read, 0, bufSize, cbInfo);
    while (!done.load(std::memory_order_acquire)) WGPU_DEVICE_TICK(device);

    if (status != WGPUMapAsyncStatus_Success) {
        return Err<std::vector<uint8_t>>(ErrorKind::Resource, "FrameCapture: readback map failed (status " +
                                                                  std::to_string(static_cast<int>(status)) + ")");
    }

    const auto* mapped = static_cast<const uint8_t*>(wgpuBufferGetConstMappedRange(_readback, 0, bufSize));
    auto pixels = packReadback(mapped, width, height, _alignedBytesPerRow, bgra);
    wgpuBufferUnmap(_readback);
    if (!pixels) {
        return Err<std::vector<uint8_t>>("FrameCapture: readback", pixels);
    }

    ytrace("FrameCapture: read {}x{}", width, height);
    return pixels;
}

Result<std::vector<uint8_t>> FrameCaptureImpl::captureFrame(const RibbonSeries& series, const TileCache& cache,
                                                            uint32_t width, uint32_t height) {
    auto pixels = readPixels(series, cache, width, height);
    if (!pixels) {
        return Err<std::vector<uint8_t>>("captureFrame", pixels);
    }
    return encodePng(*pixels, width, height);
}

} // namespace rivvon
