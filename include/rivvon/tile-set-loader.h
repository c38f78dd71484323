#pragma once

#include <rivvon/result.hpp>
#include <rivvon/tile-source.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace rivvon {

/**
 * Runs TileSetData::load on a worker thread so fetching and decoding never
 * block the frame thread. The owner is told through onReady (called on the
 * worker thread) and collects the result with take() on its own thread.
 */
class TileSetLoader {
public:
    using Ptr = std::shared_ptr<TileSetLoader>;
    using ReadyCallback = std::function<void()>;

    static Ptr create() { return Ptr(new TileSetLoader()); }

    ~TileSetLoader();

    TileSetLoader(const TileSetLoader&) = delete;
    TileSetLoader& operator=(const TileSetLoader&) = delete;

    // StateError while a previous load is still running
    Result<void> start(TileSource::Ptr source, ProgressCallback onProgress, ReadyCallback onReady);

    bool busy() const;

    // The finished load, once; nullopt while running or when nothing was started
    std::optional<Result<TileSetData>> take();

    // Block until the worker is done
    void wait();

private:
    TileSetLoader() = default;

    mutable std::mutex _mutex;
    std::thread _worker;
    bool _running = false;
    std::optional<Result<TileSetData>> _result;
};

} // namespace rivvon
