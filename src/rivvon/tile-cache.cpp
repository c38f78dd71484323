#include <rivvon/tile-cache.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace rivvon {

// =============================================================================
// TileCacheImpl
// =============================================================================

class TileCacheImpl : public TileCache {
public:
    TileCacheImpl(TileSetInfo info, TileTextureManager::Ptr textures, Config config) noexcept;
    ~TileCacheImpl() override;

    Result<void> init(std::vector<DecodedTile>& tiles) noexcept;

    // Tile set
    const TileSetInfo& info() const override { return _info; }
    uint32_t tileCount() const override { return _info.tileCount; }
    uint32_t layerCount() const override { return _info.layerCount; }
    CycleMode mode() const override { return _info.mode; }
    bool rotate90() const override { return _config.rotate90; }
    uint32_t tileLookup(uint64_t globalIndex) const override;
    TextureId tileTexture(uint32_t tile) const override;
    uint32_t tileLayerCount(uint32_t tile) const override;

    // Materials
    Result<MaterialHandle> getMaterial(uint64_t globalIndex) override;
    Result<MaterialHandle> createFlowMaterial(uint64_t baseIndex) override;
    void clearFlowMaterials() override;
    std::optional<MaterialKind> resolve(MaterialHandle handle) const override;

    // Layer cycling
    void tick(double nowMs) override;
    uint32_t currentLayer() const override { return _currentLayer; }
    int direction() const override { return _direction; }
    void setLayer(uint32_t layer) override;
    void setFps(float fps) override;
    float fps() const override { return _config.fps; }
    double layerCyclePeriod() const override;
    double optimalUndulationPeriod(double targetSeconds) const override;

    // Flow
    bool setFlowEnabled(bool enabled) override;
    bool flowEnabled() const override { return _config.flowEnabled; }
    void setFlowSpeed(float tilesPerSecond) override { _config.flowSpeed = tilesPerSecond; }
    float flowSpeed() const override { return _config.flowSpeed; }
    bool flowActive() const override { return _config.flowEnabled && _config.flowSpeed != 0.0f; }
    double flowOffset() const override { return _flowOffset; }
    uint32_t tileFlowOffset() const override { return _tileFlowOffset; }
    void wrapFlowOffset(int64_t wholeTiles) override;

    // Disposable
    Result<void> dispose() override;
    LifecycleState lifecycleState() const override { return _state; }

    Stats stats() const override;

private:
    Result<void> requireReady(const char* op) const;
    MaterialHandle addMaterial(MaterialKind kind);
    void advanceLayer();
    Result<void> releaseTextures();

    TileSetInfo _info;
    TileTextureManager::Ptr _textures;
    Config _config;
    LifecycleState _state = LifecycleState::Uninitialized;

    std::vector<TextureId> _tileTextures;
    std::vector<uint32_t> _tileLayers;

    // material index, keyed by handle id
    std::unordered_map<uint32_t, MaterialKind> _materials;
    std::vector<MaterialHandle> _singleByTile;
    std::vector<MaterialHandle> _flowMaterials;
    uint32_t _nextMaterialId = 1;  // 0 = invalid
    uint64_t _flowMaterialsCreated = 0;

    // layer cycling
    uint32_t _currentLayer = 0;
    int _direction = 1;
    std::optional<double> _lastTickMs;
    double _lastStepMs = 0.0;
    uint64_t _layerSteps = 0;

    // flow
    double _flowOffset = 0.0;
    uint32_t _tileFlowOffset = 0;
};

// =============================================================================
// Factory
// =============================================================================

Result<TileCache::Ptr> TileCache::create(TileSource& source,
                                         TileTextureManager::Ptr textures,
                                         Config config,
                                         const ProgressCallback& onProgress) noexcept {
    auto data = TileSetData::load(source, onProgress);
    if (!data) {
        return Err<Ptr>("Failed to load tiles", data);
    }
    return create(std::move(*data), std::move(textures), config);
}

Result<TileCache::Ptr> TileCache::create(TileSetData data,
                                         TileTextureManager::Ptr textures,
                                         Config config) noexcept {
    if (!textures) {
        return Err<Ptr>(ErrorKind::State, "TileCache::create: no texture manager");
    }
    auto cache = std::make_shared<TileCacheImpl>(std::move(data.info), std::move(textures), config);
    if (auto res = cache->init(data.tiles); !res) {
        return Err<Ptr>("Failed to initialize TileCache", res);
    }
    return Ok(std::move(cache));
}

// =============================================================================
// Lifecycle
// =============================================================================

TileCacheImpl::TileCacheImpl(TileSetInfo info, TileTextureManager::Ptr textures, Config config) noexcept
    : _info(std::move(info))
    , _textures(std::move(textures))
    , _config(config) {
}

TileCacheImpl::~TileCacheImpl() {
    if (auto res = dispose(); !res) {
        ywarn("TileCache: dispose on destruction failed: {}", error_msg(res));
    }
}

Result<void> TileCacheImpl::init(std::vector<DecodedTile>& tiles) noexcept {
    if (tiles.empty()) {
        return Err(ErrorKind::Resource, "tiles unavailable: tile set '" + _info.name + "' is empty");
    }

    _info.tileCount = static_cast<uint32_t>(tiles.size());
    if (_info.layerCount == 0) {
        _info.layerCount = tiles.front().layers;
    }

    _tileTextures.reserve(tiles.size());
    _tileLayers.reserve(tiles.size());

    for (size_t i = 0; i < tiles.size(); ++i) {
        const auto& tile = tiles[i];
        Result<TextureId> id = Err<TextureId>(ErrorKind::Resource, "tile has no image data");
        if (!tile.levels.empty()) {
            if (!_textures->supportsFormat(tile.format)) {
                id = Err<TextureId>(ErrorKind::Resource,
                                    std::string("format ") + toString(tile.format) + " not supported by device");
            } else {
                id = _textures->upload(tile);
            }
        }

        if (!id) {
            if (auto res = releaseTextures(); !res) {
                ywarn("TileCache: cleanup after failed upload: {}", error_msg(res));
            }
            return Err(ErrorKind::Resource, "tiles unavailable: tile " + std::to_string(i) + " upload failed", id);
        }
        _tileTextures.push_back(*id);
        _tileLayers.push_back(tile.layers);
        // pixel data now lives on the GPU
        tiles[i].levels.clear();
    }

    _singleByTile.assign(_info.tileCount, MaterialHandle::invalid());
    _state = LifecycleState::Ready;

    yinfo("TileCache: '{}' ready, {} tiles x {} layers, mode={} fps={}",
          _info.name, _info.tileCount, _info.layerCount, toString(_info.mode), _config.fps);
    return Ok();
}

Result<void> TileCacheImpl::dispose() {
    if (_state == LifecycleState::Disposed) {
        return Ok();
    }
    _materials.clear();
    _singleByTile.clear();
    _flowMaterials.clear();
    _state = LifecycleState::Disposed;

    auto res = releaseTextures();
    ydebug("TileCache: '{}' disposed", _info.name);
    return res;
}

Result<void> TileCacheImpl::releaseTextures() {
    Result<void> first = Ok();
    for (auto id : _tileTextures) {
        if (auto res = _textures->release(id); !res && first) {
            first = Err("release tile texture " + std::to_string(id.id), res);
        }
    }
    _tileTextures.clear();
    _tileLayers.clear();
    return first;
}

Result<void> TileCacheImpl::requireReady(const char* op) const {
    if (_state != LifecycleState::Ready) {
        return Err(ErrorKind::State,
                   std::string("TileCache::") + op + ": cache is " + toString(_state));
    }
    return Ok();
}

// =============================================================================
// Tiles and materials
// =============================================================================

uint32_t TileCacheImpl::tileLookup(uint64_t globalIndex) const {
    if (_info.tileCount == 0) {
        return 0;
    }
    return static_cast<uint32_t>(globalIndex % _info.tileCount);
}

TextureId TileCacheImpl::tileTexture(uint32_t tile) const {
    return tile < _tileTextures.size() ? _tileTextures[tile] : TextureId::invalid();
}

uint32_t TileCacheImpl::tileLayerCount(uint32_t tile) const {
    return tile < _tileLayers.size() ? _tileLayers[tile] : 0;
}

MaterialHandle TileCacheImpl::addMaterial(MaterialKind kind) {
    MaterialHandle handle{_nextMaterialId++};
    _materials.emplace(handle.id, kind);
    return handle;
}

Result<MaterialHandle> TileCacheImpl::getMaterial(uint64_t globalIndex) {
    if (auto res = requireReady("getMaterial"); !res) {
        return Err<MaterialHandle>("getMaterial", res);
    }
    uint32_t tile = tileLookup(globalIndex);
    auto& slot = _singleByTile[tile];
    if (!slot.isValid()) {
        slot = addMaterial(SingleTileMaterial{tile});
        ytrace("TileCache: single material {} for tile {}", slot.id, tile);
    }
    return Ok(slot);
}

Result<MaterialHandle> TileCacheImpl::createFlowMaterial(uint64_t baseIndex) {
    if (auto res = requireReady("createFlowMaterial"); !res) {
        return Err<MaterialHandle>("createFlowMaterial", res);
    }
    const uint32_t n = _info.tileCount;
    uint32_t current = static_cast<uint32_t>((baseIndex % n + _tileFlowOffset) % n);
    uint32_t next = (current + 1) % n;

    auto handle = addMaterial(FlowTileMaterial{baseIndex, current, next});
    _flowMaterials.push_back(handle);
    ++_flowMaterialsCreated;
    return Ok(handle);
}

void TileCacheImpl::clearFlowMaterials() {
    for (auto handle : _flowMaterials) {
        _materials.erase(handle.id);
    }
    if (!_flowMaterials.empty()) {
        ytrace("TileCache: cleared {} flow materials", _flowMaterials.size());
    }
    _flowMaterials.clear();
}

std::optional<MaterialKind> TileCacheImpl::resolve(MaterialHandle handle) const {
    auto it = _materials.find(handle.id);
    if (it == _materials.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Layer cycling
// =============================================================================

void TileCacheImpl::tick(double nowMs) {
    if (_state != LifecycleState::Ready) {
        return;
    }
    if (!_lastTickMs) {
        _lastTickMs = nowMs;
        _lastStepMs = nowMs;
        return;
    }

    double dtMs = std::max(0.0, nowMs - *_lastTickMs);
    _lastTickMs = nowMs;

    if (flowActive()) {
        _flowOffset += static_cast<double>(_config.flowSpeed) * dtMs / 1000.0;
    }

    if (_info.layerCount <= 1 || _config.fps <= 0.0f) {
        _lastStepMs = nowMs;
        return;
    }

    // one step per tick at most, remainder dropped
    if (nowMs - _lastStepMs >= 1000.0 / _config.fps) {
        _lastStepMs = nowMs;
        advanceLayer();
    }
}

void TileCacheImpl::advanceLayer() {
    const int64_t last = static_cast<int64_t>(_info.layerCount) - 1;

    if (_info.mode == CycleMode::Waves) {
        _currentLayer = (_currentLayer + 1) % _info.layerCount;
    } else {
        int64_t layer = static_cast<int64_t>(_currentLayer) + _direction;
        if (layer >= last) {
            layer = last;
            _direction = -1;
        } else if (layer <= 0) {
            layer = 0;
            _direction = 1;
        }
        _currentLayer = static_cast<uint32_t>(layer);
    }
    ++_layerSteps;
}

void TileCacheImpl::setLayer(uint32_t layer) {
    if (_info.layerCount == 0) {
        _currentLayer = 0;
        return;
    }
    const uint32_t last = _info.layerCount - 1;
    _currentLayer = std::min(layer, last);
    if (_info.mode == CycleMode::Planes) {
        if (_currentLayer == 0) {
            _direction = 1;
        } else if (_currentLayer == last) {
            _direction = -1;
        }
    }
}

void TileCacheImpl::setFps(float fps) {
    _config.fps = std::max(0.0f, fps);
}

double TileCacheImpl::layerCyclePeriod() const {
    if (_info.layerCount <= 1 || _config.fps <= 0.0f) {
        return 0.0;
    }
    double layers = _info.mode == CycleMode::Waves
        ? static_cast<double>(_info.layerCount)
        : 2.0 * static_cast<double>(_info.layerCount - 1);
    return layers / _config.fps;
}

double TileCacheImpl::optimalUndulationPeriod(double targetSeconds) const {
    double cycle = layerCyclePeriod();
    if (cycle <= 0.0) {
        return targetSeconds;
    }
    double cycles = std::max(1.0, std::round(targetSeconds / cycle));
    return cycles * cycle;
}

// =============================================================================
// Flow
// =============================================================================

bool TileCacheImpl::setFlowEnabled(bool enabled) {
    if (_config.flowEnabled == enabled) {
        return false;
    }
    _config.flowEnabled = enabled;
    if (!enabled) {
        _flowOffset = 0.0;
        _tileFlowOffset = 0;
    }
    ydebug("TileCache: flow {}", enabled ? "enabled" : "disabled");
    return true;
}

void TileCacheImpl::wrapFlowOffset(int64_t wholeTiles) {
    const int64_t n = _info.tileCount;
    if (n == 0) {
        return;
    }
    int64_t shifted = (static_cast<int64_t>(_tileFlowOffset) + wholeTiles % n + n) % n;
    _tileFlowOffset = static_cast<uint32_t>(shifted);
    _flowOffset -= static_cast<double>(wholeTiles);
}

TileCache::Stats TileCacheImpl::stats() const {
    uint32_t singles = 0;
    for (const auto& handle : _singleByTile) {
        if (handle.isValid()) ++singles;
    }
    return Stats{
        _info.tileCount,
        _info.layerCount,
        singles,
        static_cast<uint32_t>(_flowMaterials.size()),
        _layerSteps,
        _flowMaterialsCreated,
    };
}

} // namespace rivvon
