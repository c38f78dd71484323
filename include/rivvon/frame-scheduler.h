#pragma once

#include <rivvon/result.hpp>
#include <functional>
#include <memory>

struct uv_loop_s;
typedef struct uv_loop_s uv_loop_t;

namespace rivvon {

/**
 * FrameScheduler calls a frame callback once per display frame until
 * cancelled. The callback receives a monotonic timestamp in milliseconds.
 */
class FrameScheduler {
public:
    using Ptr = std::shared_ptr<FrameScheduler>;
    using FrameCallback = std::function<void(double nowMs)>;

    virtual ~FrameScheduler() = default;

    virtual Result<void> schedule(FrameCallback callback) = 0;
    virtual void cancel() = 0;
    virtual bool scheduled() const = 0;

    // libuv repeating timer on the given loop
    static Result<Ptr> createUv(uv_loop_t* loop, double fps) noexcept;

protected:
    FrameScheduler() = default;
};

/**
 * Frames are driven explicitly through pump(). Used headless (export) and
 * by tests.
 */
class ManualFrameScheduler : public FrameScheduler {
public:
    using Ptr = std::shared_ptr<ManualFrameScheduler>;

    static Ptr create() { return Ptr(new ManualFrameScheduler()); }

    Result<void> schedule(FrameCallback callback) override {
        if (!callback) {
            return Err(ErrorKind::State, "ManualFrameScheduler: empty callback");
        }
        _callback = std::move(callback);
        return Ok();
    }
    void cancel() override { _callback = nullptr; }
    bool scheduled() const override { return static_cast<bool>(_callback); }

    // Run one frame; false when nothing is scheduled
    bool pump(double nowMs) {
        if (!_callback) return false;
        auto callback = _callback;
        callback(nowMs);
        return true;
    }

private:
    ManualFrameScheduler() = default;

    FrameCallback _callback;
};

} // namespace rivvon
