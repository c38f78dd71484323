#pragma once

#include <rivvon/ribbon-renderer.h>
#include <rivvon/webgpu-context.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace rivvon {

/**
 * FrameCapture renders the series into an offscreen target of the surface
 * format and reads it back, blocking on the map callback.
 */
class FrameCapture {
public:
    using Ptr = std::shared_ptr<FrameCapture>;

    static Result<Ptr> create(WebGPUContext::Ptr context, RibbonRenderer::Ptr renderer) noexcept;

    virtual ~FrameCapture() = default;

    // Tightly packed, top-down RGBA8
    virtual Result<std::vector<uint8_t>> readPixels(const RibbonSeries& series, const TileCache& cache,
                                                    uint32_t width, uint32_t height) = 0;

    // PNG bytes
    virtual Result<std::vector<uint8_t>> captureFrame(const RibbonSeries& series, const TileCache& cache,
                                                      uint32_t width, uint32_t height) = 0;

protected:
    FrameCapture() = default;
};

} // namespace rivvon
