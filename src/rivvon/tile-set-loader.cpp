#include <rivvon/tile-set-loader.h>
#include <ytrace/ytrace.hpp>

namespace rivvon {

TileSetLoader::~TileSetLoader() {
    wait();
}

Result<void> TileSetLoader::start(TileSource::Ptr source, ProgressCallback onProgress, ReadyCallback onReady) {
    if (!source) {
        return Err(ErrorKind::State, "TileSetLoader::start: no tile source");
    }
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_running) {
            return Err(ErrorKind::State, "TileSetLoader::start: a load is already running");
        }
        _running = true;
        _result.reset();
    }
    // previous worker has finished but may not be joined yet
    if (_worker.joinable()) {
        _worker.join();
    }

    ydebug("TileSetLoader: loading {}", source->label());
    _worker = std::thread([this, source = std::move(source),
                           onProgress = std::move(onProgress), onReady = std::move(onReady)]() {
        auto data = TileSetData::load(*source, onProgress);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _result = std::move(data);
            _running = false;
        }
        if (onReady) {
            onReady();
        }
    });
    return Ok();
}

bool TileSetLoader::busy() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _running;
}

std::optional<Result<TileSetData>> TileSetLoader::take() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_running || !_result) {
        return std::nullopt;
    }
    auto result = std::move(_result);
    _result.reset();
    return result;
}

void TileSetLoader::wait() {
    if (_worker.joinable()) {
        _worker.join();
    }
}

} // namespace rivvon
