#pragma once

#include <rivvon/result.hpp>
#include <rivvon/types.h>
#include <cstddef>

namespace rivvon {

struct PathProcessorConfig {
    float minDistance = 0.001f;    // sanitize: closer points are merged
    size_t smoothSamples = 150;    // smooth: output point count
    float targetSize = 8.0f;       // normalize: larger bbox extent after scaling
    uint32_t samplesPerSpan = 16;  // Catmull-Rom evaluation density before resampling
};

/**
 * PathProcessor turns raw point sequences (drawn strokes, SVG samples, text
 * outlines) into clean, evenly sampled, normalized sequences for ribbon
 * construction.
 *
 * All operations are pure: inputs are never modified.
 */
class PathProcessor {
public:
    using Config = PathProcessorConfig;

    explicit PathProcessor(Config config = {}) : _config(config) {}

    const Config& config() const { return _config; }

    // Drop non-finite points and points closer than minDistance to the
    // previously kept point.
    PointSequence sanitize(const PointSequence& points) const;
    PointSequence sanitize(const PointSequence& points, float minDistance) const;

    // Centripetal Catmull-Rom through the input, resampled uniformly in arc
    // length to targetCount points. < 2 points are returned unchanged.
    PointSequence smooth(const PointSequence& points) const;
    PointSequence smooth(const PointSequence& points, size_t targetCount) const;

    // Single screen-space stroke (y down) -> centred, y-up, z = 0, larger
    // extent == targetSize.
    PointSequence normalizeDrawing(const PointSequence& points) const;

    // One shared bounding box for all paths: uniform scale, x/y centred,
    // z unchanged. Relative arrangement between paths is preserved.
    PathSet normalizeTogether(const PathSet& paths) const;
    PathSet normalizeTogether(const PathSet& paths, float targetSize) const;

    // Evenly spaced points every ~spacing units, endpoints kept.
    // Yields ceil(length / spacing) segments.
    PointSequence resampleByArcLength(const PointSequence& points, float spacing) const;

    // normalizeDrawing -> sanitize -> smooth
    Result<PointSequence> prepareStroke(const PointSequence& points) const;

    // per path sanitize -> smooth, then normalizeTogether
    PathSet prepareMultiPath(const PathSet& paths) const;

    // ConstructionError when no ribbon can be built from the points
    static Result<void> validate(const PointSequence& points);

    static float pathLength(const PointSequence& points);

private:
    Config _config;
};

} // namespace rivvon
