#include <rivvon/frame-scheduler.h>
#include <ytrace/ytrace.hpp>
#include <uv.h>
#include <algorithm>
#include <cmath>

namespace rivvon {

//=============================================================================
// UvFrameScheduler
//=============================================================================

class UvFrameScheduler : public FrameScheduler {
public:
    UvFrameScheduler(uv_loop_t* loop, double fps) noexcept : _loop(loop), _fps(fps) {}

    ~UvFrameScheduler() override {
        cancel();
        if (_timer) {
            // handle memory is freed once libuv has closed it
            uv_close(reinterpret_cast<uv_handle_t*>(_timer), [](uv_handle_t* h) {
                delete reinterpret_cast<uv_timer_t*>(h);
            });
            _timer = nullptr;
        }
    }

    Result<void> init() noexcept {
        if (!_loop) {
            return Err(ErrorKind::State, "UvFrameScheduler: no event loop");
        }
        if (!(_fps > 0.0)) {
            return Err(ErrorKind::State, "UvFrameScheduler: fps must be > 0");
        }
        _timer = new uv_timer_t;
        if (int r = uv_timer_init(_loop, _timer); r != 0) {
            delete _timer;
            _timer = nullptr;
            return Err(ErrorKind::Resource, std::string("uv_timer_init: ") + uv_strerror(r));
        }
        _timer->data = this;
        return Ok();
    }

    Result<void> schedule(FrameCallback callback) override {
        if (!callback) {
            return Err(ErrorKind::State, "UvFrameScheduler: empty callback");
        }
        _callback = std::move(callback);
        auto intervalMs = static_cast<uint64_t>(std::max(1.0, std::round(1000.0 / _fps)));
        if (int r = uv_timer_start(_timer, onTimer, intervalMs, intervalMs); r != 0) {
            _callback = nullptr;
            return Err(ErrorKind::Resource, std::string("uv_timer_start: ") + uv_strerror(r));
        }
        ydebug("UvFrameScheduler: frames every {} ms", intervalMs);
        return Ok();
    }

    void cancel() override {
        if (_timer && _callback) {
            uv_timer_stop(_timer);
        }
        _callback = nullptr;
    }

    bool scheduled() const override { return static_cast<bool>(_callback); }

private:
    static void onTimer(uv_timer_t* handle) {
        auto* self = static_cast<UvFrameScheduler*>(handle->data);
        if (!self->_callback) return;
        double nowMs = static_cast<double>(uv_hrtime()) / 1e6;
        auto callback = self->_callback;
        callback(nowMs);
    }

    uv_loop_t* _loop;
    double _fps;
    uv_timer_t* _timer = nullptr;
    FrameCallback _callback;
};

Result<FrameScheduler::Ptr> FrameScheduler::createUv(uv_loop_t* loop, double fps) noexcept {
    auto scheduler = std::make_shared<UvFrameScheduler>(loop, fps);
    if (auto res = scheduler->init(); !res) {
        return Err<Ptr>("Failed to create frame scheduler", res);
    }
    return Ok(std::move(scheduler));
}

} // namespace rivvon
