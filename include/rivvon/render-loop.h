#pragma once

#include <rivvon/result.hpp>
#include <rivvon/frame-scheduler.h>
#include <rivvon/ribbon-series.h>
#include <rivvon/tile-cache.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace rivvon {

// Issues the draw for one frame
class FrameRenderer {
public:
    using Ptr = std::shared_ptr<FrameRenderer>;

    virtual ~FrameRenderer() = default;
    virtual Result<void> drawFrame(const RibbonSeries& series, const TileCache& cache) = 0;
};

enum class RenderLoopState {
    Stopped,
    Running,
};

/**
 * RenderLoop drives one synchronous tick per frame, always in this order:
 *
 *   1. TileCache::tick           (layer cycling, flow offset)
 *   2. updateFlowMaterials       (flow toggles and tile swaps)
 *   3. RibbonSeries::update      (wave undulation)
 *   4. render callback
 *   5. FrameRenderer::drawFrame
 *
 * A failing tick stops the loop; the error is kept in lastError().
 */
class RenderLoop {
public:
    using Ptr = std::shared_ptr<RenderLoop>;
    using RenderCallback = std::function<void(double elapsedSeconds)>;

    static Result<Ptr> create(FrameScheduler::Ptr scheduler, FrameRenderer::Ptr renderer) noexcept;

    virtual ~RenderLoop() = default;

    virtual RenderLoop& setTileCache(const TileCache::Ptr& cache) = 0;
    virtual RenderLoop& setRibbonSeries(const RibbonSeries::Ptr& series) = 0;

    // stopped -> running
    virtual Result<void> start(RenderCallback callback = {}) = 0;

    // running -> stopped; no-op when already stopped
    virtual Result<void> stop() = 0;

    // One frame at nowMs. Usable while stopped to drive frames by hand.
    virtual Result<void> tick(double nowMs) = 0;

    // Steps 1 to 4 without drawing (offscreen capture draws itself)
    virtual Result<void> advance(double nowMs) = 0;

    virtual RenderLoopState state() const = 0;
    virtual bool isRunning() const = 0;
    virtual uint64_t frameCount() const = 0;
    virtual double elapsedSeconds() const = 0;
    virtual std::optional<Error> lastError() const = 0;

protected:
    RenderLoop() = default;
};

} // namespace rivvon
