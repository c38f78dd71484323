//=============================================================================
// Ribbon Unit Tests
//
// Covers: segment construction and indexing, tile binding, build failures
// and rollback, rebuild with a new offset, wave update, dispose
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "rivvon/ribbon.h"
#include "harness/mock_gpu.h"
#include <cmath>

using namespace boost::ut;
using namespace rivvon;
using namespace rivvon::test;

suite ribbon_tests = [] {
    //=========================================================================
    // Build
    //=========================================================================

    "N points build N-1 segments"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 4, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }

        Ribbon::Config config;
        config.subdivisions = 6;
        auto ribbon = Ribbon::create(meshes, config);
        expect(ribbon.has_value()) << error_msg(ribbon);
        if (!ribbon) return;
        auto& r = **ribbon;

        r.setTileCache(*cache);
        auto res = r.buildFromPoints(straightPath(9), 0.8f);
        expect(res.has_value()) << error_msg(res);

        expect(r.segmentCount() == 8_u);
        expect(meshes->liveMeshCount() == 8_u) << "One mesh per segment";
        expect(r.lifecycleState() == LifecycleState::Ready);
        expect(std::fabs(r.length() - 8.0f) < 1e-4f);

        for (const auto& seg : r.segments()) {
            expect(seg.vertices.size() == 14_u) << "(subdivisions + 1) * 2";
            expect(seg.indices.size() == 36_u) << "subdivisions * 6";
            expect(seg.mesh.isValid());
            expect(seg.material.isValid());
        }
    };

    "segments carry globalIndex = offset + local index"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 5, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }

        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        auto& r = **ribbon;
        r.setTileCache(*cache).setSegmentOffset(17);

        expect(r.buildFromPoints(straightPath(6), 1.0f).has_value());
        const auto& segs = r.segments();
        for (size_t i = 0; i < segs.size(); ++i) {
            expect(segs[i].localIndex == static_cast<uint32_t>(i));
            expect(segs[i].globalIndex == 17u + i);

            auto kind = (*cache)->resolve(segs[i].material);
            expect(kind.has_value());
            if (!kind) continue;
            expect(std::get<SingleTileMaterial>(*kind).tile == static_cast<uint32_t>((17 + i) % 5));
        }
    };

    "ribbon width sets the distance between edge vertices"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 2, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }

        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        (*ribbon)->setTileCache(*cache);
        expect((*ribbon)->buildFromPoints(straightPath(3), 2.0f).has_value());

        const auto& v = (*ribbon)->segments().front().vertices;
        glm::vec3 left(v[0].position[0], v[0].position[1], v[0].position[2]);
        glm::vec3 right(v[1].position[0], v[1].position[1], v[1].position[2]);
        expect(std::fabs(glm::distance(left, right) - 2.0f) < 1e-3f);
        expect(v[0].uv[1] == 0.0f && v[1].uv[1] == 1.0f) << "Across the ribbon";
        expect(v[0].uv[0] == 0.0f && v.back().uv[0] == 1.0f) << "Along the segment";
    };

    "coincident points still give one segment per pair"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 3, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }

        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        (*ribbon)->setTileCache(*cache);
        PointSequence points = {{0, 0, 0}, {1, 0, 0}, {1, 0, 0}, {2, 1, 0}};
        auto res = (*ribbon)->buildFromPoints(points, 1.0f);
        expect(res.has_value()) << error_msg(res);
        expect((*ribbon)->segmentCount() == 3_u);
        for (const auto& seg : (*ribbon)->segments()) {
            for (const auto& n : seg.normals) {
                expect(std::isfinite(n.x) && std::isfinite(n.y) && std::isfinite(n.z));
            }
        }
    };

    "build binds shared single-tile materials even while flow is active"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 3, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        (*cache)->setFlowEnabled(true);
        (*cache)->setFlowSpeed(1.0f);

        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        (*ribbon)->setTileCache(*cache);
        expect((*ribbon)->buildFromPoints(straightPath(4), 1.0f).has_value());

        for (const auto& seg : (*ribbon)->segments()) {
            auto kind = (*cache)->resolve(seg.material);
            expect(kind.has_value() && !isFlowMaterial(*kind));
        }
        expect((*cache)->stats().flowMaterials == 0_u) << "Flow materials are bound by the series";
        expect((*cache)->stats().flowMaterialsCreated == 0_u);
        expect((*cache)->stats().singleMaterials == 3_u);
    };

    //=========================================================================
    // Failures
    //=========================================================================

    "build without a ready cache is a state error"_test = [] {
        auto meshes = MockMeshBufferManager::create();
        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }

        auto unbound = (*ribbon)->buildFromPoints(straightPath(3), 1.0f);
        expect(!unbound);
        expect(error_kind(unbound) == ErrorKind::State);

        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 2, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        (*ribbon)->setTileCache(*cache);
        expect((*cache)->dispose().has_value());

        auto disposed = (*ribbon)->buildFromPoints(straightPath(3), 1.0f);
        expect(!disposed);
        expect(error_kind(disposed) == ErrorKind::State);
        expect(meshes->liveMeshCount() == 0_u);
    };

    "degenerate input is a construction error"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 2, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        (*ribbon)->setTileCache(*cache);

        auto one = (*ribbon)->buildFromPoints(PointSequence{glm::vec3(1, 2, 3)}, 1.0f);
        expect(!one);
        expect(error_kind(one) == ErrorKind::Construction);

        auto flat = (*ribbon)->buildFromPoints(straightPath(3), 0.0f);
        expect(!flat);
        expect(error_kind(flat) == ErrorKind::Construction);

        auto same = (*ribbon)->buildFromPoints(PointSequence(4, glm::vec3(2, 2, 2)), 1.0f);
        expect(!same);
        expect(error_kind(same) == ErrorKind::Construction);

        expect(meshes->liveMeshCount() == 0_u);
        expect((*ribbon)->segmentCount() == 0_u);
    };

    "failed build keeps the previous segments"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 3, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        (*ribbon)->setTileCache(*cache);

        expect((*ribbon)->buildFromPoints(straightPath(5), 1.0f).has_value());
        expect(meshes->liveMeshCount() == 4_u);

        meshes->failAfter(2);
        auto res = (*ribbon)->buildFromPoints(straightPath(8), 1.0f);
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);
        expect((*ribbon)->segmentCount() == 4_u) << "Old geometry kept";
        expect((*ribbon)->lastPoints().size() == 5_u);
        expect(meshes->liveMeshCount() == 4_u) << "Partial allocations released";
    };

    //=========================================================================
    // Rebuild, update, dispose
    //=========================================================================

    "rebuild applies a new segment offset"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 4, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        auto& r = **ribbon;
        r.setTileCache(*cache);

        expect(!r.rebuild()) << "Nothing built yet";
        expect(r.buildFromPoints(straightPath(4), 1.5f).has_value());
        r.setSegmentOffset(10);
        expect(r.segments().front().globalIndex == 0_u) << "Offset read at build time only";

        expect(r.rebuild().has_value());
        expect(r.segmentCount() == 3_u);
        expect(r.segments().front().globalIndex == 10_u);
        expect(r.lastWidth() == 1.5f);
        expect(meshes->liveMeshCount() == 3_u) << "Old meshes released";
    };

    "update rewrites vertices of every segment"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        TileCache::Config cacheConfig;
        cacheConfig.fps = 30.0f;
        auto cache = makeCache(textures, 2, 30, CycleMode::Waves, cacheConfig);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        auto& r = **ribbon;
        r.setTileCache(*cache);

        expect(r.buildFromPoints(straightPath(6), 1.0f).has_value());
        expect(r.waveSpeed() > 0.0);
        auto before = r.segments()[2].vertices[0].position[1];

        expect(r.update(0.37).has_value());
        expect(meshes->vertexWrites() == 5_i);
        auto after = r.segments()[2].vertices[0].position[1];
        expect(before != after) << "Wave twist moves the edge";
    };

    "dispose releases meshes and blocks further builds"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto meshes = MockMeshBufferManager::create();
        auto cache = makeCache(textures, 2, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        auto& r = **ribbon;
        r.setTileCache(*cache);

        expect(r.buildFromPoints(straightPath(4), 1.0f).has_value());
        expect(r.dispose().has_value());
        expect(meshes->liveMeshCount() == 0_u);
        expect(r.segmentCount() == 0_u);
        expect(r.dispose().has_value()) << "Idempotent";

        auto res = r.buildFromPoints(straightPath(4), 1.0f);
        expect(!res);
        expect(error_kind(res) == ErrorKind::State);
    };

    "ribbon does not keep the cache alive"_test = [] {
        auto meshes = MockMeshBufferManager::create();
        auto ribbon = Ribbon::create(meshes);
        if (!ribbon) { expect(false) << error_msg(ribbon); return; }
        {
            auto textures = MockTileTextureManager::create();
            auto cache = makeCache(textures, 2, 1);
            if (!cache) { expect(false) << error_msg(cache); return; }
            (*ribbon)->setTileCache(*cache);
            expect((*ribbon)->hasTileCache());
        }
        expect(!(*ribbon)->hasTileCache());
    };

    "create without a mesh manager fails"_test = [] {
        auto ribbon = Ribbon::create(nullptr);
        expect(!ribbon);
        expect(error_kind(ribbon) == ErrorKind::State);
    };
};
