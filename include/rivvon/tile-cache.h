#pragma once

#include <rivvon/result.hpp>
#include <rivvon/lifecycle.h>
#include <rivvon/material.h>
#include <rivvon/tile-set.h>
#include <rivvon/tile-source.h>
#include <rivvon/tile-texture-manager.h>
#include <cstdint>
#include <memory>
#include <optional>

namespace rivvon {

struct TileCacheConfig {
    float fps = 30.0f;          // layer steps per second
    float flowSpeed = 0.0f;     // tiles per second, signed
    bool flowEnabled = false;
    bool rotate90 = true;       // tiles are authored sideways
};

/**
 * TileCache owns a loaded tile set: one GPU texture per tile, the materials
 * that sample them, the layer cycling state and the flow state.
 *
 * It is the single writer of currentLayer and flowOffset. Ribbons hold only
 * MaterialHandles; materials live in the cache's index until the cache
 * clears or disposes them.
 *
 * A cache is only ever returned fully loaded. If any tile cannot be fetched,
 * decoded or uploaded, create() fails with a "tiles unavailable" ResourceError
 * and no textures remain allocated.
 */
class TileCache : public Tickable, public Disposable {
public:
    using Config = TileCacheConfig;
    using Ptr = std::shared_ptr<TileCache>;

    // Fetch + decode + upload in one call (blocking)
    static Result<Ptr> create(TileSource& source,
                              TileTextureManager::Ptr textures,
                              Config config = {},
                              const ProgressCallback& onProgress = {}) noexcept;

    // Upload tiles decoded elsewhere (see TileSetData::load)
    static Result<Ptr> create(TileSetData data,
                              TileTextureManager::Ptr textures,
                              Config config = {}) noexcept;

    ~TileCache() override = default;

    // =========================================================================
    // Tile set
    // =========================================================================
    virtual const TileSetInfo& info() const = 0;
    virtual uint32_t tileCount() const = 0;
    virtual uint32_t layerCount() const = 0;
    virtual CycleMode mode() const = 0;
    virtual bool rotate90() const = 0;

    // global segment index -> tile, always in [0, tileCount)
    virtual uint32_t tileLookup(uint64_t globalIndex) const = 0;
    virtual TextureId tileTexture(uint32_t tile) const = 0;
    virtual uint32_t tileLayerCount(uint32_t tile) const = 0;

    // =========================================================================
    // Materials
    // =========================================================================

    // Single-tile material for tileLookup(globalIndex); shared per tile
    virtual Result<MaterialHandle> getMaterial(uint64_t globalIndex) = 0;

    // Dual-tile material sampling tile[(baseIndex + tileFlowOffset) mod N] and its successor
    virtual Result<MaterialHandle> createFlowMaterial(uint64_t baseIndex) = 0;

    // Drop every flow material created so far
    virtual void clearFlowMaterials() = 0;

    virtual std::optional<MaterialKind> resolve(MaterialHandle handle) const = 0;

    // =========================================================================
    // Layer cycling
    // =========================================================================
    virtual uint32_t currentLayer() const = 0;
    virtual int direction() const = 0;
    virtual void setLayer(uint32_t layer) = 0;
    virtual void setFps(float fps) = 0;
    virtual float fps() const = 0;

    // Seconds for one full layer cycle (waves: N/fps, planes: 2(N-1)/fps)
    virtual double layerCyclePeriod() const = 0;

    // Whole number of layer cycles closest to targetSeconds
    virtual double optimalUndulationPeriod(double targetSeconds = 3.0) const = 0;

    // =========================================================================
    // Flow
    // =========================================================================

    // Returns whether the enabled state changed. Disabling resets both offsets.
    virtual bool setFlowEnabled(bool enabled) = 0;
    virtual bool flowEnabled() const = 0;
    virtual void setFlowSpeed(float tilesPerSecond) = 0;
    virtual float flowSpeed() const = 0;
    virtual bool flowActive() const = 0;

    // Fractional progress toward the next tile swap
    virtual double flowOffset() const = 0;
    virtual uint32_t tileFlowOffset() const = 0;

    // Advance the base tile offset by wholeTiles (mod tileCount) and
    // subtract it from the flow offset.
    virtual void wrapFlowOffset(int64_t wholeTiles) = 0;

    // =========================================================================
    // Stats
    // =========================================================================
    struct Stats {
        uint32_t tileCount;
        uint32_t layerCount;
        uint32_t singleMaterials;
        uint32_t flowMaterials;
        uint64_t layerSteps;
        uint64_t flowMaterialsCreated;
    };
    virtual Stats stats() const = 0;

protected:
    TileCache() = default;
};

} // namespace rivvon
