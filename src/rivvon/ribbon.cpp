#include <rivvon/ribbon.h>
#include <rivvon/path-processor.h>
#include <ytrace/ytrace.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <cmath>

namespace rivvon {

constexpr float NORMAL_SMOOTHING = 0.1f;
constexpr float DEGENERATE_LENGTH = 1e-6f;

// =============================================================================
// Frame helpers
// =============================================================================

static glm::vec3 referenceNormal(const glm::vec3& tangent) {
    glm::vec3 n = glm::cross(glm::vec3(0.0f, 1.0f, 0.0f), tangent);
    if (glm::length(n) < 0.1f) {
        n = glm::cross(glm::vec3(1.0f, 0.0f, 0.0f), tangent);
    }
    return glm::normalize(n);
}

// Carry prev along to the new tangent without flipping, lightly smoothed
static glm::vec3 propagateNormal(const glm::vec3& prev, const glm::vec3& tangent) {
    glm::vec3 binormal = glm::cross(tangent, prev);
    if (glm::length(binormal) < DEGENERATE_LENGTH) {
        return prev;
    }
    glm::vec3 normal = glm::normalize(glm::cross(glm::normalize(binormal), tangent));
    if (glm::dot(normal, prev) < 0.0f) {
        normal = -normal;
    }
    return glm::normalize(glm::mix(prev, normal, NORMAL_SMOOTHING));
}

// Unit direction of each pair; zero-length pairs borrow a neighbour's
static std::vector<glm::vec3> pairDirections(const PointSequence& points) {
    std::vector<glm::vec3> dirs(points.size() - 1, glm::vec3(0.0f));
    std::vector<bool> valid(dirs.size(), false);
    for (size_t i = 0; i < dirs.size(); ++i) {
        glm::vec3 d = points[i + 1] - points[i];
        float len = glm::length(d);
        if (len > DEGENERATE_LENGTH) {
            dirs[i] = d / len;
            valid[i] = true;
        }
    }
    auto firstValid = std::find(valid.begin(), valid.end(), true);
    glm::vec3 carry = firstValid == valid.end()
        ? glm::vec3(1.0f, 0.0f, 0.0f)
        : dirs[static_cast<size_t>(firstValid - valid.begin())];
    for (size_t i = 0; i < dirs.size(); ++i) {
        if (valid[i]) {
            carry = dirs[i];
        } else {
            dirs[i] = carry;
        }
    }
    return dirs;
}

// =============================================================================
// RibbonImpl
// =============================================================================

class RibbonImpl : public Ribbon {
public:
    RibbonImpl(MeshBufferManager::Ptr meshes, Config config) noexcept
        : _meshes(std::move(meshes)), _config(config) {}
    ~RibbonImpl() override;

    Result<void> init() noexcept;

    Ribbon& setTileCache(const TileCache::Ptr& cache) override {
        _cache = cache;
        return *this;
    }
    bool hasTileCache() const override { return !_cache.expired(); }

    Ribbon& setSegmentOffset(uint64_t offset) override {
        _segmentOffset = offset;
        return *this;
    }
    uint64_t segmentOffset() const override { return _segmentOffset; }

    Result<void> buildFromPoints(const PointSequence& points, float width, double time) override;
    Result<void> rebuild(double time) override;
    Result<void> update(double time) override;
    Result<void> setSegmentMaterial(size_t index, MaterialHandle material) override;

    size_t segmentCount() const override { return _segments.size(); }
    const std::vector<Segment>& segments() const override { return _segments; }
    const PointSequence& lastPoints() const override { return _lastPoints; }
    float lastWidth() const override { return _lastWidth; }
    float length() const override { return _length; }
    double waveSpeed() const override { return _waveSpeed; }

    Result<void> dispose() override;
    LifecycleState lifecycleState() const override { return _state; }

private:
    Result<std::vector<Segment>> buildSegments(const PointSequence& points, float width, double time);
    void fillVertices(Segment& segment, float width, double time) const;
    Result<void> releaseSegments(std::vector<Segment>& segments);

    MeshBufferManager::Ptr _meshes;
    Config _config;
    std::weak_ptr<TileCache> _cache;
    LifecycleState _state = LifecycleState::Uninitialized;

    uint64_t _segmentOffset = 0;
    std::vector<Segment> _segments;
    PointSequence _lastPoints;
    float _lastWidth = 0.0f;
    float _length = 0.0f;
    double _waveSpeed = 0.0;
};

// =============================================================================
// Factory
// =============================================================================

Result<Ribbon::Ptr> Ribbon::create(MeshBufferManager::Ptr meshes, Config config) noexcept {
    auto ribbon = std::make_shared<RibbonImpl>(std::move(meshes), config);
    if (auto res = ribbon->init(); !res) {
        return Err<Ptr>("Failed to initialize Ribbon", res);
    }
    return Ok(std::move(ribbon));
}

Result<void> RibbonImpl::init() noexcept {
    if (!_meshes) {
        return Err(ErrorKind::State, "Ribbon: no mesh buffer manager");
    }
    _config.subdivisions = std::max(1u, _config.subdivisions);
    return Ok();
}

RibbonImpl::~RibbonImpl() {
    if (auto res = dispose(); !res) {
        ywarn("Ribbon: dispose on destruction failed: {}", error_msg(res));
    }
}

// =============================================================================
// Build
// =============================================================================

Result<void> RibbonImpl::buildFromPoints(const PointSequence& points, float width, double time) {
    if (_state == LifecycleState::Disposed) {
        return Err(ErrorKind::State, "Ribbon::buildFromPoints: ribbon is disposed");
    }
    auto cache = _cache.lock();
    if (!cache) {
        return Err(ErrorKind::State, "Ribbon::buildFromPoints: no tile cache bound");
    }
    if (cache->lifecycleState() != LifecycleState::Ready) {
        return Err(ErrorKind::State, std::string("Ribbon::buildFromPoints: tile cache is ") +
                                         toString(cache->lifecycleState()));
    }
    if (auto res = PathProcessor::validate(points); !res) {
        return Err("Ribbon::buildFromPoints", res);
    }
    if (!(width > 0.0f)) {
        return Err(ErrorKind::Construction, "Ribbon::buildFromPoints: width must be > 0");
    }
    float length = PathProcessor::pathLength(points);
    if (!(length > DEGENERATE_LENGTH)) {
        return Err(ErrorKind::Construction, "Ribbon::buildFromPoints: path has zero length");
    }

    _waveSpeed = glm::two_pi<double>() / cache->optimalUndulationPeriod(_config.undulationPeriod);

    auto built = buildSegments(points, width, time);
    if (!built) {
        return Err("Ribbon::buildFromPoints", built);
    }

    // materials last: geometry is complete and the cache was checked above.
    // Single-tile materials are shared per tile; flow materials are bound by the series.
    for (auto& segment : *built) {
        auto material = cache->getMaterial(segment.globalIndex);
        if (!material) {
            if (auto res = releaseSegments(*built); !res) {
                ywarn("Ribbon: cleanup after material failure: {}", error_msg(res));
            }
            return Err("Ribbon::buildFromPoints: material", material);
        }
        segment.material = *material;
    }

    // swap in; old geometry released, old materials belong to the cache
    auto res = releaseSegments(_segments);
    _segments = std::move(*built);
    _lastPoints = points;
    _lastWidth = width;
    _length = length;
    _state = LifecycleState::Ready;

    ydebug("Ribbon: built {} segments, offset {}, length {:.3f}",
           _segments.size(), _segmentOffset, length);
    if (!res) {
        return Err("Ribbon::buildFromPoints: releasing previous segments", res);
    }
    return Ok();
}

Result<std::vector<Segment>> RibbonImpl::buildSegments(const PointSequence& points, float width, double time) {
    const size_t pairs = points.size() - 1;
    const uint32_t steps = _config.subdivisions;

    auto dirs = pairDirections(points);

    // joint tangents shared by the two segments meeting there
    std::vector<glm::vec3> joints(points.size());
    joints.front() = dirs.front();
    joints.back() = dirs.back();
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        glm::vec3 sum = dirs[i - 1] + dirs[i];
        joints[i] = glm::length(sum) > DEGENERATE_LENGTH ? glm::normalize(sum) : dirs[i];
    }

    std::vector<Segment> segments;
    segments.reserve(pairs);

    glm::vec3 normal = referenceNormal(joints.front());
    float arcStart = 0.0f;

    for (size_t i = 0; i < pairs; ++i) {
        Segment seg;
        seg.localIndex = static_cast<uint32_t>(i);
        seg.globalIndex = _segmentOffset + i;

        const float segLength = glm::distance(points[i], points[i + 1]);
        seg.centers.reserve(steps + 1);
        seg.tangents.reserve(steps + 1);
        seg.normals.reserve(steps + 1);
        seg.arcLengths.reserve(steps + 1);
        seg.localT.reserve(steps + 1);

        for (uint32_t s = 0; s <= steps; ++s) {
            float t = static_cast<float>(s) / static_cast<float>(steps);
            glm::vec3 tangent = glm::mix(joints[i], joints[i + 1], t);
            tangent = glm::length(tangent) > DEGENERATE_LENGTH ? glm::normalize(tangent) : dirs[i];

            // first sample of a segment is the previous segment's last one
            if (s > 0) {
                normal = propagateNormal(normal, tangent);
            }

            seg.centers.push_back(glm::mix(points[i], points[i + 1], t));
            seg.tangents.push_back(tangent);
            seg.normals.push_back(normal);
            seg.arcLengths.push_back(arcStart + t * segLength);
            seg.localT.push_back(t);
        }
        arcStart += segLength;

        seg.indices.reserve(static_cast<size_t>(steps) * 6);
        for (uint32_t s = 0; s < steps; ++s) {
            uint32_t base = s * 2;
            seg.indices.insert(seg.indices.end(), {base, base + 1, base + 2, base + 1, base + 3, base + 2});
        }
        fillVertices(seg, width, time);

        auto mesh = _meshes->allocate(static_cast<uint32_t>(seg.vertices.size()),
                                      static_cast<uint32_t>(seg.indices.size()));
        if (!mesh) {
            if (auto res = releaseSegments(segments); !res) {
                ywarn("Ribbon: cleanup after allocation failure: {}", error_msg(res));
            }
            return Err<std::vector<Segment>>(ErrorKind::Resource,
                                             "segment " + std::to_string(i) + " mesh allocation", mesh);
        }
        seg.mesh = *mesh;
        segments.push_back(std::move(seg));

        if (auto res = _meshes->write(segments.back().mesh, segments.back().vertices, segments.back().indices); !res) {
            if (auto rel = releaseSegments(segments); !rel) {
                ywarn("Ribbon: cleanup after upload failure: {}", error_msg(rel));
            }
            return Err<std::vector<Segment>>(ErrorKind::Resource,
                                             "segment " + std::to_string(i) + " mesh upload", res);
        }
    }

    return Ok(std::move(segments));
}

void RibbonImpl::fillVertices(Segment& segment, float width, double time) const {
    const float half = width * 0.5f;
    const size_t samples = segment.centers.size();
    segment.vertices.resize(samples * 2);

    for (size_t k = 0; k < samples; ++k) {
        const glm::vec3& tangent = segment.tangents[k];
        float phase = static_cast<float>(
            std::sin(segment.arcLengths[k] * _config.waveFrequency * glm::two_pi<double>() + time * _waveSpeed) *
            _config.waveAmplitude);

        glm::vec3 twisted = glm::angleAxis(phase, tangent) * segment.normals[k];
        glm::vec3 left = segment.centers[k] - twisted * half;
        glm::vec3 right = segment.centers[k] + twisted * half;
        glm::vec3 faceNormal = glm::cross(tangent, twisted);
        faceNormal = glm::length(faceNormal) > DEGENERATE_LENGTH ? glm::normalize(faceNormal)
                                                                 : glm::vec3(0.0f, 0.0f, 1.0f);
        float t = segment.localT[k];

        segment.vertices[k * 2] = RibbonVertex{{left.x, left.y, left.z},
                                               {faceNormal.x, faceNormal.y, faceNormal.z},
                                               {t, 0.0f}};
        segment.vertices[k * 2 + 1] = RibbonVertex{{right.x, right.y, right.z},
                                                   {faceNormal.x, faceNormal.y, faceNormal.z},
                                                   {t, 1.0f}};
    }
}

Result<void> RibbonImpl::rebuild(double time) {
    if (_lastPoints.size() < 2) {
        return Err(ErrorKind::State, "Ribbon::rebuild: nothing built yet");
    }
    PointSequence points = _lastPoints;
    return buildFromPoints(points, _lastWidth, time);
}

// =============================================================================
// Animation
// =============================================================================

Result<void> RibbonImpl::update(double time) {
    if (_state != LifecycleState::Ready) {
        return Ok();
    }
    for (auto& segment : _segments) {
        fillVertices(segment, _lastWidth, time);
        if (auto res = _meshes->writeVertices(segment.mesh, segment.vertices); !res) {
            return Err("Ribbon::update: segment " + std::to_string(segment.localIndex), res);
        }
    }
    return Ok();
}

Result<void> RibbonImpl::setSegmentMaterial(size_t index, MaterialHandle material) {
    if (index >= _segments.size()) {
        return Err(ErrorKind::State, "Ribbon::setSegmentMaterial: segment " + std::to_string(index) +
                                         " of " + std::to_string(_segments.size()));
    }
    _segments[index].material = material;
    return Ok();
}

// =============================================================================
// Dispose
// =============================================================================

Result<void> RibbonImpl::releaseSegments(std::vector<Segment>& segments) {
    Result<void> first = Ok();
    for (auto& segment : segments) {
        if (!segment.mesh.isValid()) continue;
        if (auto res = _meshes->release(segment.mesh); !res && first) {
            first = Err("release mesh " + std::to_string(segment.mesh.id), res);
        }
        segment.mesh = MeshHandle::invalid();
    }
    segments.clear();
    return first;
}

Result<void> RibbonImpl::dispose() {
    if (_state == LifecycleState::Disposed) {
        return Ok();
    }
    _state = LifecycleState::Disposed;
    return releaseSegments(_segments);
}

} // namespace rivvon
