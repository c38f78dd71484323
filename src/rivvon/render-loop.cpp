#include <rivvon/render-loop.h>
#include <ytrace/ytrace.hpp>

namespace rivvon {

// =============================================================================
// RenderLoopImpl
// =============================================================================

class RenderLoopImpl : public RenderLoop, public std::enable_shared_from_this<RenderLoopImpl> {
public:
    RenderLoopImpl(FrameScheduler::Ptr scheduler, FrameRenderer::Ptr renderer) noexcept
        : _scheduler(std::move(scheduler)), _renderer(std::move(renderer)) {}
    ~RenderLoopImpl() override;

    Result<void> init() noexcept;

    RenderLoop& setTileCache(const TileCache::Ptr& cache) override {
        _cache = cache;
        return *this;
    }
    RenderLoop& setRibbonSeries(const RibbonSeries::Ptr& series) override {
        _series = series;
        return *this;
    }

    Result<void> start(RenderCallback callback) override;
    Result<void> stop() override;
    Result<void> tick(double nowMs) override;
    Result<void> advance(double nowMs) override;

    RenderLoopState state() const override { return _state; }
    bool isRunning() const override { return _state == RenderLoopState::Running; }
    uint64_t frameCount() const override { return _frameCount; }
    double elapsedSeconds() const override { return _elapsedSeconds; }
    std::optional<Error> lastError() const override { return _lastError; }

private:
    void onFrame(double nowMs);

    FrameScheduler::Ptr _scheduler;
    FrameRenderer::Ptr _renderer;
    TileCache::Ptr _cache;
    RibbonSeries::Ptr _series;
    RenderCallback _callback;

    RenderLoopState _state = RenderLoopState::Stopped;
    std::optional<double> _originMs;
    double _elapsedSeconds = 0.0;
    uint64_t _frameCount = 0;
    std::optional<Error> _lastError;
};

// =============================================================================
// Factory
// =============================================================================

Result<RenderLoop::Ptr> RenderLoop::create(FrameScheduler::Ptr scheduler, FrameRenderer::Ptr renderer) noexcept {
    auto loop = std::make_shared<RenderLoopImpl>(std::move(scheduler), std::move(renderer));
    if (auto res = loop->init(); !res) {
        return Err<Ptr>("Failed to create RenderLoop", res);
    }
    return Ok(std::move(loop));
}

Result<void> RenderLoopImpl::init() noexcept {
    if (!_scheduler) {
        return Err(ErrorKind::State, "RenderLoop: no frame scheduler");
    }
    if (!_renderer) {
        return Err(ErrorKind::State, "RenderLoop: no frame renderer");
    }
    return Ok();
}

RenderLoopImpl::~RenderLoopImpl() {
    if (_state == RenderLoopState::Running) {
        _scheduler->cancel();
    }
}

// =============================================================================
// State machine
// =============================================================================

Result<void> RenderLoopImpl::start(RenderCallback callback) {
    if (_state == RenderLoopState::Running) {
        return Err(ErrorKind::State, "RenderLoop::start: already running");
    }
    if (!_cache || !_series) {
        return Err(ErrorKind::State, "RenderLoop::start: tile cache and ribbon series must be set");
    }

    _callback = std::move(callback);
    _lastError.reset();

    std::weak_ptr<RenderLoopImpl> weak = weak_from_this();
    auto res = _scheduler->schedule([weak](double nowMs) {
        if (auto self = weak.lock()) {
            self->onFrame(nowMs);
        }
    });
    if (!res) {
        return Err("RenderLoop::start", res);
    }

    _state = RenderLoopState::Running;
    yinfo("RenderLoop: started");
    return Ok();
}

Result<void> RenderLoopImpl::stop() {
    if (_state == RenderLoopState::Stopped) {
        return Ok();
    }
    _scheduler->cancel();
    _state = RenderLoopState::Stopped;
    yinfo("RenderLoop: stopped after {} frames", _frameCount);
    return Ok();
}

void RenderLoopImpl::onFrame(double nowMs) {
    if (_state != RenderLoopState::Running) {
        return;
    }
    if (auto res = tick(nowMs); !res) {
        yerror("RenderLoop: frame {} failed: {}", _frameCount, error_msg(res));
        _lastError = res.error();
        if (auto stopped = stop(); !stopped) {
            yerror("RenderLoop: stop failed: {}", error_msg(stopped));
        }
    }
}

// =============================================================================
// Frame
// =============================================================================

Result<void> RenderLoopImpl::tick(double nowMs) {
    if (auto res = advance(nowMs); !res) {
        return res;
    }
    if (auto res = _renderer->drawFrame(*_series, *_cache); !res) {
        return Err("RenderLoop: draw", res);
    }

    ++_frameCount;
    ytrace("RenderLoop: frame {} at {:.3f}s", _frameCount, _elapsedSeconds);
    return Ok();
}

Result<void> RenderLoopImpl::advance(double nowMs) {
    if (!_cache || !_series) {
        return Err(ErrorKind::State, "RenderLoop: tile cache and ribbon series must be set");
    }
    if (!_originMs) {
        _originMs = nowMs;
    }
    _elapsedSeconds = (nowMs - *_originMs) / 1000.0;

    _cache->tick(nowMs);

    if (auto res = _series->updateFlowMaterials(); !res) {
        return Err("RenderLoop: flow materials", res);
    }
    if (auto res = _series->update(_elapsedSeconds); !res) {
        return Err("RenderLoop: geometry update", res);
    }
    if (_callback) {
        _callback(_elapsedSeconds);
    }
    return Ok();
}

} // namespace rivvon
