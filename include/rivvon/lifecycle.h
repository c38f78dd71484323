#pragma once

#include <rivvon/result.hpp>

namespace rivvon {

enum class LifecycleState {
    Uninitialized,
    Ready,
    Disposed,
};

inline const char* toString(LifecycleState state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::Ready:         return "ready";
        case LifecycleState::Disposed:      return "disposed";
    }
    return "unknown";
}

// Advanced once per frame by the render loop
class Tickable {
public:
    virtual ~Tickable() = default;
    virtual void tick(double nowMs) = 0;
};

// Owns releasable resources. dispose() is idempotent.
class Disposable {
public:
    virtual ~Disposable() = default;
    virtual Result<void> dispose() = 0;
    virtual LifecycleState lifecycleState() const = 0;
};

} // namespace rivvon
