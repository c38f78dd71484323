#pragma once

#include <rivvon/result.hpp>
#include <rivvon/lifecycle.h>
#include <rivvon/mesh-buffer-manager.h>
#include <rivvon/ribbon.h>
#include <rivvon/tile-cache.h>
#include <rivvon/types.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace rivvon {

/**
 * RibbonSeries builds one Ribbon per path with globally contiguous segment
 * indices, so a single tile strip flows across every path as if they were one:
 *
 *   offset(ribbon[i+1]) == offset(ribbon[i]) + segmentCount(ribbon[i])
 *
 * It also owns the flow material protocol: when flow is active every segment
 * samples two adjacent tiles, and whenever the cache's flow offset leaves
 * [0, 1) the base tile offset is advanced and every flow material recreated.
 *
 * Builds are transactional. Paths with < 2 points are skipped with a warning;
 * any other failure leaves the previous ribbons, paths and cache in place.
 */
class RibbonSeries : public Disposable {
public:
    using Ptr = std::shared_ptr<RibbonSeries>;

    static Result<Ptr> create(MeshBufferManager::Ptr meshes, Ribbon::Config ribbonConfig = {}) noexcept;

    ~RibbonSeries() override = default;

    virtual RibbonSeries& setTileCache(const TileCache::Ptr& cache) = 0;
    virtual TileCache::Ptr tileCache() const = 0;

    // Returns the number of ribbons built
    virtual Result<size_t> buildFromMultiplePaths(const PathSet& paths, float width, double time = 0.0) = 0;
    virtual Result<size_t> buildFromPoints(const PointSequence& points, float width, double time = 0.0) = 0;

    // Rebuild the cached paths against another tile set. On failure the
    // series keeps its previous cache and ribbons.
    virtual Result<size_t> switchTileCache(const TileCache::Ptr& cache, double time = 0.0) = 0;

    // Pick single or dual-tile materials for every segment
    virtual Result<void> initFlowMaterials() = 0;

    // Per frame: react to flow toggles and perform tile swaps
    virtual Result<void> updateFlowMaterials() = 0;

    // Per frame: wave undulation
    virtual Result<void> update(double time) = 0;

    // Dispose every ribbon and forget cached paths
    virtual Result<void> cleanup() = 0;

    virtual size_t ribbonCount() const = 0;
    virtual const std::vector<Ribbon::Ptr>& ribbons() const = 0;
    virtual uint64_t totalSegmentCount() const = 0;
    virtual size_t skippedPathCount() const = 0;

    virtual const PathSet& lastPaths() const = 0;
    virtual float lastWidth() const = 0;

    virtual bool flowWasActive() const = 0;
    virtual uint32_t lastTileFlowOffset() const = 0;
    virtual uint64_t flowSwapCount() const = 0;

protected:
    RibbonSeries() = default;
};

} // namespace rivvon
