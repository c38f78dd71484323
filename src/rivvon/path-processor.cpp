#include <rivvon/path-processor.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace rivvon {

// =============================================================================
// Helpers
// =============================================================================

static bool isFinite(const glm::vec3& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

static float chordLength(const glm::vec3& a, const glm::vec3& b, float fallback) {
    // centripetal parameterization: |b - a| ^ 0.5
    float d = std::pow(glm::dot(b - a, b - a), 0.25f);
    return d < 1e-4f ? fallback : d;
}

// Non-uniform Catmull-Rom span between p1 and p2, evaluated at t in [0, 1]
static glm::vec3 catmullRom(const glm::vec3& p0, const glm::vec3& p1,
                            const glm::vec3& p2, const glm::vec3& p3, float t) {
    float dt1 = chordLength(p1, p2, 1.0f);
    float dt0 = chordLength(p0, p1, dt1);
    float dt2 = chordLength(p2, p3, dt1);

    glm::vec3 t1 = (p1 - p0) / dt0 - (p2 - p0) / (dt0 + dt1) + (p2 - p1) / dt1;
    glm::vec3 t2 = (p2 - p1) / dt1 - (p3 - p1) / (dt1 + dt2) + (p3 - p2) / dt2;
    t1 *= dt1;
    t2 *= dt1;

    glm::vec3 c0 = p1;
    glm::vec3 c1 = t1;
    glm::vec3 c2 = -3.0f * p1 + 3.0f * p2 - 2.0f * t1 - t2;
    glm::vec3 c3 = 2.0f * p1 - 2.0f * p2 + t1 + t2;

    float t2s = t * t;
    return c0 + c1 * t + c2 * t2s + c3 * (t2s * t);
}

// Linear resample of a polyline to `count` points equally spaced in arc length
static PointSequence resampleUniform(const PointSequence& polyline, size_t count) {
    PointSequence out;
    if (polyline.size() < 2 || count < 2) {
        return polyline;
    }

    std::vector<float> cumulative(polyline.size(), 0.0f);
    for (size_t i = 1; i < polyline.size(); ++i) {
        cumulative[i] = cumulative[i - 1] + glm::distance(polyline[i - 1], polyline[i]);
    }
    float total = cumulative.back();
    if (total <= 0.0f) {
        return polyline;
    }

    out.reserve(count);
    size_t span = 0;
    for (size_t k = 0; k < count; ++k) {
        float target = total * static_cast<float>(k) / static_cast<float>(count - 1);
        while (span + 2 < polyline.size() && cumulative[span + 1] < target) {
            ++span;
        }
        float spanLen = cumulative[span + 1] - cumulative[span];
        float t = spanLen > 0.0f ? (target - cumulative[span]) / spanLen : 0.0f;
        out.push_back(glm::mix(polyline[span], polyline[span + 1], std::clamp(t, 0.0f, 1.0f)));
    }
    out.back() = polyline.back();
    return out;
}

// =============================================================================
// Sanitize / smooth
// =============================================================================

PointSequence PathProcessor::sanitize(const PointSequence& points) const {
    return sanitize(points, _config.minDistance);
}

PointSequence PathProcessor::sanitize(const PointSequence& points, float minDistance) const {
    PointSequence out;
    out.reserve(points.size());
    size_t dropped = 0;

    for (const auto& p : points) {
        if (!isFinite(p)) {
            ++dropped;
            continue;
        }
        if (!out.empty() && glm::distance(out.back(), p) < minDistance) {
            ++dropped;
            continue;
        }
        out.push_back(p);
    }

    if (dropped > 0) {
        ydebug("PathProcessor: sanitize dropped {} of {} points", dropped, points.size());
    }
    return out;
}

PointSequence PathProcessor::smooth(const PointSequence& points) const {
    return smooth(points, _config.smoothSamples);
}

PointSequence PathProcessor::smooth(const PointSequence& points, size_t targetCount) const {
    if (points.size() < 2) {
        return points;
    }
    targetCount = std::max<size_t>(targetCount, 2);

    if (points.size() == 2) {
        return resampleUniform(points, targetCount);
    }

    // Extrapolated end controls, as for an open curve
    glm::vec3 head = points[0] * 2.0f - points[1];
    glm::vec3 tail = points.back() * 2.0f - points[points.size() - 2];

    const uint32_t perSpan = std::max<uint32_t>(_config.samplesPerSpan, 1);
    PointSequence dense;
    dense.reserve((points.size() - 1) * perSpan + 1);

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const glm::vec3& p0 = i == 0 ? head : points[i - 1];
        const glm::vec3& p1 = points[i];
        const glm::vec3& p2 = points[i + 1];
        const glm::vec3& p3 = i + 2 < points.size() ? points[i + 2] : tail;
        for (uint32_t s = 0; s < perSpan; ++s) {
            float t = static_cast<float>(s) / static_cast<float>(perSpan);
            dense.push_back(catmullRom(p0, p1, p2, p3, t));
        }
    }
    dense.push_back(points.back());

    return resampleUniform(dense, targetCount);
}

// =============================================================================
// Normalization
// =============================================================================

PointSequence PathProcessor::normalizeDrawing(const PointSequence& points) const {
    if (points.empty()) {
        return {};
    }

    glm::vec2 lo(std::numeric_limits<float>::max());
    glm::vec2 hi(std::numeric_limits<float>::lowest());
    for (const auto& p : points) {
        lo = glm::min(lo, glm::vec2(p));
        hi = glm::max(hi, glm::vec2(p));
    }

    glm::vec2 size = hi - lo;
    float maxDim = std::max(size.x, size.y);
    float scale = maxDim > 0.0f ? _config.targetSize / maxDim : 1.0f;
    glm::vec2 center = (lo + hi) * 0.5f;

    PointSequence out;
    out.reserve(points.size());
    for (const auto& p : points) {
        // screen y grows downward
        out.emplace_back((p.x - center.x) * scale, -(p.y - center.y) * scale, 0.0f);
    }
    return out;
}

PathSet PathProcessor::normalizeTogether(const PathSet& paths) const {
    return normalizeTogether(paths, _config.targetSize);
}

PathSet PathProcessor::normalizeTogether(const PathSet& paths, float targetSize) const {
    glm::vec2 lo(std::numeric_limits<float>::max());
    glm::vec2 hi(std::numeric_limits<float>::lowest());
    bool any = false;

    for (const auto& path : paths) {
        for (const auto& p : path) {
            lo = glm::min(lo, glm::vec2(p));
            hi = glm::max(hi, glm::vec2(p));
            any = true;
        }
    }
    if (!any) {
        return paths;
    }

    glm::vec2 size = hi - lo;
    float maxDim = std::max(size.x, size.y);
    float scale = maxDim > 0.0f ? targetSize / maxDim : 1.0f;
    glm::vec2 center = (lo + hi) * 0.5f;

    PathSet out;
    out.reserve(paths.size());
    for (const auto& path : paths) {
        PointSequence scaled;
        scaled.reserve(path.size());
        for (const auto& p : path) {
            scaled.emplace_back((p.x - center.x) * scale, (p.y - center.y) * scale, p.z);
        }
        out.push_back(std::move(scaled));
    }

    ydebug("PathProcessor: normalized {} paths, bbox {:.3f}x{:.3f} scale {:.4f}",
           paths.size(), size.x, size.y, scale);
    return out;
}

PointSequence PathProcessor::resampleByArcLength(const PointSequence& points, float spacing) const {
    if (points.size() < 2 || spacing <= 0.0f) {
        return points;
    }
    float length = pathLength(points);
    if (length <= 0.0f) {
        return points;
    }
    auto segments = static_cast<size_t>(std::max(1.0f, std::ceil(length / spacing)));
    return resampleUniform(points, segments + 1);
}

// =============================================================================
// Pipelines
// =============================================================================

Result<PointSequence> PathProcessor::prepareStroke(const PointSequence& points) const {
    auto normalized = normalizeDrawing(points);
    auto clean = sanitize(normalized);
    if (auto res = validate(clean); !res) {
        return Err<PointSequence>("prepareStroke: stroke unusable", res);
    }
    return Ok(smooth(clean));
}

PathSet PathProcessor::prepareMultiPath(const PathSet& paths) const {
    PathSet smoothed;
    smoothed.reserve(paths.size());
    for (const auto& path : paths) {
        // invalid paths are passed through so the series can report and skip them
        smoothed.push_back(smooth(sanitize(path)));
    }
    return normalizeTogether(smoothed);
}

Result<void> PathProcessor::validate(const PointSequence& points) {
    if (points.size() < 2) {
        return Err(ErrorKind::Construction,
                   "path has " + std::to_string(points.size()) + " point(s), need at least 2");
    }
    return Ok();
}

float PathProcessor::pathLength(const PointSequence& points) {
    float length = 0.0f;
    for (size_t i = 1; i < points.size(); ++i) {
        length += glm::distance(points[i - 1], points[i]);
    }
    return length;
}

} // namespace rivvon
