#pragma once

#include <rivvon/result.hpp>
#include <rivvon/lifecycle.h>
#include <rivvon/material.h>
#include <rivvon/mesh-buffer-manager.h>
#include <rivvon/tile-cache.h>
#include <rivvon/types.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace rivvon {

struct RibbonConfig {
    uint32_t subdivisions = 8;      // strips per segment, for smooth undulation
    float waveAmplitude = 0.075f;   // radians of twist
    float waveFrequency = 0.5f;     // waves per unit of arc length
    double undulationPeriod = 3.0;  // seconds, snapped to whole layer cycles
};

// One quad between two consecutive path points, bound to one tile index
struct Segment {
    uint32_t localIndex = 0;
    uint64_t globalIndex = 0;  // localIndex + segment offset
    MeshHandle mesh = MeshHandle::invalid();
    MaterialHandle material = MaterialHandle::invalid();

    // per sample along the segment (subdivisions + 1)
    std::vector<glm::vec3> centers;
    std::vector<glm::vec3> tangents;
    std::vector<glm::vec3> normals;
    std::vector<float> arcLengths;
    std::vector<float> localT;

    std::vector<RibbonVertex> vertices;
    std::vector<uint32_t> indices;
};

/**
 * Ribbon builds quad segments along one point sequence.
 *
 * Segment i gets tile index i + segmentOffset; the offset is read at build
 * time only. Segments are built with the cache's shared single-tile
 * materials; flow materials are assigned afterwards through
 * setSegmentMaterial by the owning RibbonSeries. The cache is referenced
 * weakly and never mutated beyond requesting materials.
 */
class Ribbon : public Disposable {
public:
    using Config = RibbonConfig;
    using Ptr = std::shared_ptr<Ribbon>;

    static Result<Ptr> create(MeshBufferManager::Ptr meshes, Config config = {}) noexcept;

    ~Ribbon() override = default;

    virtual Ribbon& setTileCache(const TileCache::Ptr& cache) = 0;
    virtual bool hasTileCache() const = 0;

    virtual Ribbon& setSegmentOffset(uint64_t offset) = 0;
    virtual uint64_t segmentOffset() const = 0;

    // Replace all segments. On failure the previous segments are kept.
    virtual Result<void> buildFromPoints(const PointSequence& points, float width, double time = 0.0) = 0;

    // Build again from lastPoints/lastWidth (new offset or new tile set)
    virtual Result<void> rebuild(double time = 0.0) = 0;

    // Wave undulation, vertex data rewritten in place
    virtual Result<void> update(double time) = 0;

    virtual Result<void> setSegmentMaterial(size_t index, MaterialHandle material) = 0;

    virtual size_t segmentCount() const = 0;
    virtual const std::vector<Segment>& segments() const = 0;
    virtual const PointSequence& lastPoints() const = 0;
    virtual float lastWidth() const = 0;
    virtual float length() const = 0;

    // radians per second, derived from the cache's layer cycle at build
    virtual double waveSpeed() const = 0;

protected:
    Ribbon() = default;
};

} // namespace rivvon
