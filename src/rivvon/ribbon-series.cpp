#include <rivvon/ribbon-series.h>
#include <ytrace/ytrace.hpp>
#include <cmath>

namespace rivvon {

// =============================================================================
// RibbonSeriesImpl
// =============================================================================

class RibbonSeriesImpl : public RibbonSeries {
public:
    RibbonSeriesImpl(MeshBufferManager::Ptr meshes, Ribbon::Config ribbonConfig) noexcept
        : _meshes(std::move(meshes)), _ribbonConfig(ribbonConfig) {}
    ~RibbonSeriesImpl() override;

    Result<void> init() noexcept;

    RibbonSeries& setTileCache(const TileCache::Ptr& cache) override {
        _cache = cache;
        return *this;
    }
    TileCache::Ptr tileCache() const override { return _cache; }

    Result<size_t> buildFromMultiplePaths(const PathSet& paths, float width, double time) override;
    Result<size_t> buildFromPoints(const PointSequence& points, float width, double time) override;
    Result<size_t> switchTileCache(const TileCache::Ptr& cache, double time) override;

    Result<void> initFlowMaterials() override;
    Result<void> updateFlowMaterials() override;
    Result<void> update(double time) override;
    Result<void> cleanup() override;

    size_t ribbonCount() const override { return _ribbons.size(); }
    const std::vector<Ribbon::Ptr>& ribbons() const override { return _ribbons; }
    uint64_t totalSegmentCount() const override { return _totalSegmentCount; }
    size_t skippedPathCount() const override { return _skippedPaths; }
    const PathSet& lastPaths() const override { return _lastPaths; }
    float lastWidth() const override { return _lastWidth; }
    bool flowWasActive() const override { return _flowWasActive; }
    uint32_t lastTileFlowOffset() const override { return _lastTileFlowOffset; }
    uint64_t flowSwapCount() const override { return _flowSwaps; }

    Result<void> dispose() override;
    LifecycleState lifecycleState() const override { return _state; }

private:
    Result<size_t> buildInto(const TileCache::Ptr& cache, const PathSet& paths, float width, double time);
    static Result<void> disposeRibbons(std::vector<Ribbon::Ptr>& ribbons);
    Result<void> requireCache(const char* op) const;

    MeshBufferManager::Ptr _meshes;
    Ribbon::Config _ribbonConfig;
    TileCache::Ptr _cache;
    LifecycleState _state = LifecycleState::Uninitialized;

    std::vector<Ribbon::Ptr> _ribbons;
    uint64_t _totalSegmentCount = 0;
    size_t _skippedPaths = 0;

    PathSet _lastPaths;
    float _lastWidth = 0.0f;

    bool _flowWasActive = false;
    uint32_t _lastTileFlowOffset = 0;
    uint64_t _flowSwaps = 0;
};

// =============================================================================
// Factory
// =============================================================================

Result<RibbonSeries::Ptr> RibbonSeries::create(MeshBufferManager::Ptr meshes, Ribbon::Config ribbonConfig) noexcept {
    auto series = std::make_shared<RibbonSeriesImpl>(std::move(meshes), ribbonConfig);
    if (auto res = series->init(); !res) {
        return Err<Ptr>("Failed to initialize RibbonSeries", res);
    }
    return Ok(std::move(series));
}

Result<void> RibbonSeriesImpl::init() noexcept {
    if (!_meshes) {
        return Err(ErrorKind::State, "RibbonSeries: no mesh buffer manager");
    }
    return Ok();
}

RibbonSeriesImpl::~RibbonSeriesImpl() {
    if (auto res = disposeRibbons(_ribbons); !res) {
        ywarn("RibbonSeries: dispose on destruction failed: {}", error_msg(res));
    }
}

Result<void> RibbonSeriesImpl::requireCache(const char* op) const {
    if (_state == LifecycleState::Disposed) {
        return Err(ErrorKind::State, std::string("RibbonSeries::") + op + ": series is disposed");
    }
    if (!_cache) {
        return Err(ErrorKind::State, std::string("RibbonSeries::") + op + ": no tile cache bound");
    }
    if (_cache->lifecycleState() != LifecycleState::Ready) {
        return Err(ErrorKind::State, std::string("RibbonSeries::") + op + ": tile cache is " +
                                         toString(_cache->lifecycleState()));
    }
    return Ok();
}

// =============================================================================
// Build
// =============================================================================

Result<size_t> RibbonSeriesImpl::buildFromMultiplePaths(const PathSet& paths, float width, double time) {
    if (auto res = requireCache("buildFromMultiplePaths"); !res) {
        return Err<size_t>("build", res);
    }
    return buildInto(_cache, paths, width, time);
}

Result<size_t> RibbonSeriesImpl::buildFromPoints(const PointSequence& points, float width, double time) {
    return buildFromMultiplePaths(PathSet{points}, width, time);
}

Result<size_t> RibbonSeriesImpl::switchTileCache(const TileCache::Ptr& cache, double time) {
    if (_state == LifecycleState::Disposed) {
        return Err<size_t>(ErrorKind::State, "RibbonSeries::switchTileCache: series is disposed");
    }
    if (!cache || cache->lifecycleState() != LifecycleState::Ready) {
        return Err<size_t>(ErrorKind::State, "RibbonSeries::switchTileCache: new tile cache is not ready");
    }
    // copy: buildInto replaces _lastPaths
    PathSet paths = _lastPaths;
    auto built = buildInto(cache, paths, _lastWidth, time);
    if (!built) {
        return Err<size_t>("switchTileCache", built);
    }
    yinfo("RibbonSeries: switched to tile set '{}' ({} tiles), {} segments",
          cache->info().name, cache->tileCount(), _totalSegmentCount);
    return built;
}

Result<size_t> RibbonSeriesImpl::buildInto(const TileCache::Ptr& cache, const PathSet& paths,
                                           float width, double time) {
    std::vector<Ribbon::Ptr> built;
    built.reserve(paths.size());
    uint64_t runningOffset = 0;
    size_t skipped = 0;

    auto rollback = [&](const Error& error) -> Result<size_t> {
        if (auto res = disposeRibbons(built); !res) {
            ywarn("RibbonSeries: rollback dispose: {}", error_msg(res));
        }
        // rebind the surviving ribbons' materials, dropping any the failed build made
        if (cache == _cache && !_ribbons.empty()) {
            if (auto res = initFlowMaterials(); !res) {
                ywarn("RibbonSeries: restoring materials after failed build: {}", error_msg(res));
            }
        } else {
            cache->clearFlowMaterials();
        }
        return Err<size_t>("RibbonSeries build failed, previous series kept", error);
    };

    for (size_t p = 0; p < paths.size(); ++p) {
        const auto& path = paths[p];
        if (path.size() < 2) {
            ywarn("RibbonSeries: skipping path {} with {} point(s)", p, path.size());
            ++skipped;
            continue;
        }

        auto ribbon = Ribbon::create(_meshes, _ribbonConfig);
        if (!ribbon) {
            return rollback(ribbon.error());
        }
        (*ribbon)->setTileCache(cache).setSegmentOffset(runningOffset);

        if (auto res = (*ribbon)->buildFromPoints(path, width, time); !res) {
            if (res.error().kind() == ErrorKind::Construction) {
                ywarn("RibbonSeries: skipping path {}: {}", p, error_msg(res));
                ++skipped;
                continue;
            }
            return rollback(res.error());
        }

        runningOffset += (*ribbon)->segmentCount();
        built.push_back(std::move(*ribbon));
    }

    // commit: old ribbons go before the new path data is cached
    auto previousCache = _cache;
    if (auto res = disposeRibbons(_ribbons); !res) {
        ywarn("RibbonSeries: disposing previous ribbons: {}", error_msg(res));
    }
    if (previousCache && previousCache != cache) {
        previousCache->clearFlowMaterials();
    }

    _lastPaths = paths;
    _lastWidth = width;
    _cache = cache;
    _ribbons = std::move(built);
    _totalSegmentCount = runningOffset;
    _skippedPaths = skipped;
    _state = LifecycleState::Ready;

    if (auto res = initFlowMaterials(); !res) {
        return Err<size_t>("RibbonSeries: materials after build", res);
    }

    yinfo("RibbonSeries: {} ribbons from {} paths, {} segments ({} skipped)",
          _ribbons.size(), paths.size(), _totalSegmentCount, skipped);
    return Ok(_ribbons.size());
}

// =============================================================================
// Flow materials
// =============================================================================

Result<void> RibbonSeriesImpl::initFlowMaterials() {
    if (auto res = requireCache("initFlowMaterials"); !res) {
        return res;
    }

    const bool active = _cache->flowActive();
    _cache->clearFlowMaterials();

    for (auto& ribbon : _ribbons) {
        const auto& segments = ribbon->segments();
        for (size_t i = 0; i < segments.size(); ++i) {
            auto material = active ? _cache->createFlowMaterial(segments[i].globalIndex)
                                   : _cache->getMaterial(segments[i].globalIndex);
            if (!material) {
                return Err("initFlowMaterials: segment " + std::to_string(segments[i].globalIndex), material);
            }
            if (auto res = ribbon->setSegmentMaterial(i, *material); !res) {
                return Err("initFlowMaterials", res);
            }
        }
    }

    _flowWasActive = active;
    _lastTileFlowOffset = _cache->tileFlowOffset();
    ydebug("RibbonSeries: {} materials for {} segments (tile offset {})",
           active ? "flow" : "single-tile", _totalSegmentCount, _lastTileFlowOffset);
    return Ok();
}

Result<void> RibbonSeriesImpl::updateFlowMaterials() {
    if (auto res = requireCache("updateFlowMaterials"); !res) {
        return res;
    }

    const bool active = _cache->flowActive();
    if (active != _flowWasActive) {
        return initFlowMaterials();
    }
    if (!active) {
        return Ok();
    }

    const double offset = _cache->flowOffset();
    if (offset >= 1.0 || offset < 0.0) {
        // floor covers forward and reverse, including multi-tile jumps
        auto wholeTiles = static_cast<int64_t>(std::floor(offset));
        _cache->wrapFlowOffset(wholeTiles);
        ++_flowSwaps;
        ytrace("RibbonSeries: flow swap by {} tiles, base offset now {}", wholeTiles, _cache->tileFlowOffset());
        return initFlowMaterials();
    }

    if (_cache->tileFlowOffset() != _lastTileFlowOffset) {
        return initFlowMaterials();
    }
    return Ok();
}

Result<void> RibbonSeriesImpl::update(double time) {
    for (auto& ribbon : _ribbons) {
        if (auto res = ribbon->update(time); !res) {
            return Err("RibbonSeries::update", res);
        }
    }
    return Ok();
}

// =============================================================================
// Cleanup
// =============================================================================

Result<void> RibbonSeriesImpl::disposeRibbons(std::vector<Ribbon::Ptr>& ribbons) {
    Result<void> first = Ok();
    for (auto& ribbon : ribbons) {
        if (auto res = ribbon->dispose(); !res && first) {
            first = res;
        }
    }
    ribbons.clear();
    return first;
}

Result<void> RibbonSeriesImpl::cleanup() {
    auto res = disposeRibbons(_ribbons);
    if (_cache && _cache->lifecycleState() == LifecycleState::Ready) {
        _cache->clearFlowMaterials();
    }
    _totalSegmentCount = 0;
    _skippedPaths = 0;
    _lastPaths.clear();
    _lastWidth = 0.0f;
    _flowWasActive = false;
    _lastTileFlowOffset = 0;
    if (!res) {
        return Err("RibbonSeries::cleanup", res);
    }
    return Ok();
}

Result<void> RibbonSeriesImpl::dispose() {
    if (_state == LifecycleState::Disposed) {
        return Ok();
    }
    auto res = cleanup();
    _state = LifecycleState::Disposed;
    return res;
}

} // namespace rivvon
