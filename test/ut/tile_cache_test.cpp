//=============================================================================
// TileCache Unit Tests
//
// Covers: loading and upload failure, tile lookup, material index,
// waves/planes layer cycling, flow offset integration and wrapping, dispose
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "rivvon/tile-cache.h"
#include "harness/mock_gpu.h"
#include <cmath>
#include <limits>

using namespace boost::ut;
using namespace rivvon;
using namespace rivvon::test;

suite tile_cache_tests = [] {
    //=========================================================================
    // Loading
    //=========================================================================

    "create uploads one texture per tile"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 6, 12);
        expect(cache.has_value()) << error_msg(cache);
        if (!cache) return;

        expect((*cache)->tileCount() == 6_u);
        expect((*cache)->layerCount() == 12_u);
        expect((*cache)->lifecycleState() == LifecycleState::Ready);
        expect(textures->liveTextureCount() == 6_u);
        for (uint32_t t = 0; t < 6; ++t) {
            expect(textures->isLive((*cache)->tileTexture(t)));
            expect((*cache)->tileLayerCount(t) == 12_u);
        }
        expect(!(*cache)->tileTexture(6).isValid()) << "Out of range tile";
    };

    "create from a source fetches and decodes"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto source = makeKtx2Source(4, 8, CycleMode::Planes);
        uint32_t lastBuilt = 0;
        auto cache = TileCache::create(*source, textures, {}, [&](LoadStage stage, uint32_t done, uint32_t) {
            if (stage == LoadStage::Building) lastBuilt = done;
        });
        expect(cache.has_value()) << error_msg(cache);
        if (!cache) return;
        expect((*cache)->tileCount() == 4_u);
        expect((*cache)->layerCount() == 8_u);
        expect((*cache)->mode() == CycleMode::Planes);
        expect(lastBuilt == 4_u);
    };

    "upload failure releases everything and reports tiles unavailable"_test = [] {
        auto textures = MockTileTextureManager::create();
        textures->failAtUpload(2);

        auto cache = makeCache(textures, 5, 4);
        expect(!cache);
        expect(error_kind(cache) == ErrorKind::Resource);
        expect(error_msg(cache).find("tiles unavailable") != std::string::npos);
        expect(textures->liveTextureCount() == 0_u) << "Partial uploads released";
        expect(textures->releaseCalls() == 2_i);
    };

    "unsupported format fails the whole set"_test = [] {
        auto textures = MockTileTextureManager::create();
        textures->setUnsupported(TileFormat::RGBA8Unorm);
        auto cache = makeCache(textures, 3, 1);
        expect(!cache);
        expect(error_kind(cache) == ErrorKind::Resource);
        expect(textures->uploadCalls() == 0_i);
    };

    "empty tile set is unavailable"_test = [] {
        auto textures = MockTileTextureManager::create();
        TileSetData data;
        data.info.name = "nothing";
        auto cache = TileCache::create(std::move(data), textures);
        expect(!cache);
        expect(error_kind(cache) == ErrorKind::Resource);
    };

    "create without a texture manager is a state error"_test = [] {
        auto cache = TileCache::create(makeTileSetData(2, 1), nullptr);
        expect(!cache);
        expect(error_kind(cache) == ErrorKind::State);
    };

    //=========================================================================
    // Lookup and materials
    //=========================================================================

    "tileLookup wraps for any index magnitude"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 7, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        const uint64_t indices[] = {
            0, 6, 7, 13, 1000003, 4294967295ull, 4294967296ull,
            123456789012345ull, std::numeric_limits<uint64_t>::max(),
        };
        for (uint64_t i : indices) {
            expect(c.tileLookup(i) == static_cast<uint32_t>(i % 7));
            expect(c.tileLookup(i) < 7_u);
        }
    };

    "single-tile materials are shared per tile"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 5, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        auto a = c.getMaterial(2);
        auto b = c.getMaterial(7);
        auto d = c.getMaterial(3);
        expect(a.has_value() && b.has_value() && d.has_value());
        expect(*a == *b) << "Index 7 maps to tile 2";
        expect(!(*a == *d));

        auto kind = c.resolve(*a);
        expect(kind.has_value());
        expect(!isFlowMaterial(*kind));
        expect(std::get<SingleTileMaterial>(*kind).tile == 2_u);
        expect(c.stats().singleMaterials == 2_u);
    };

    "flow materials pair a tile with its successor"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 4, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        auto m = c.createFlowMaterial(7);
        expect(m.has_value());
        auto kind = c.resolve(*m);
        expect(kind.has_value() && isFlowMaterial(*kind));
        const auto& flow = std::get<FlowTileMaterial>(*kind);
        expect(flow.baseIndex == 7_u);
        expect(flow.currentTile == 3_u);
        expect(flow.nextTile == 0_u) << "Successor wraps";

        c.clearFlowMaterials();
        expect(!c.resolve(*m).has_value()) << "Cleared flow material is gone";
        expect(c.stats().flowMaterials == 0_u);
        expect(c.stats().flowMaterialsCreated == 1_u);
    };

    //=========================================================================
    // Layer cycling
    //=========================================================================

    "first tick only records the time"_test = [] {
        auto textures = MockTileTextureManager::create();
        TileCache::Config config;
        config.fps = 10.0f;
        auto cache = makeCache(textures, 2, 4, CycleMode::Waves, config);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        c.tick(5000.0);
        expect(c.currentLayer() == 0_u);
        c.tick(5050.0);
        expect(c.currentLayer() == 0_u) << "Less than one frame interval";
        c.tick(5100.0);
        expect(c.currentLayer() == 1_u);
    };

    "waves layer cycling returns to 0 after layerCount steps"_test = [] {
        auto textures = MockTileTextureManager::create();
        TileCache::Config config;
        config.fps = 10.0f;
        auto cache = makeCache(textures, 3, 5, CycleMode::Waves, config);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        c.setLayer(3);
        c.setLayer(0);
        c.tick(0.0);
        for (int k = 1; k <= 5; ++k) {
            c.tick(k * 100.0);
            if (k < 5) {
                expect(c.currentLayer() == static_cast<uint32_t>(k));
            }
        }
        expect(c.currentLayer() == 0_u) << "Wrapped after layerCount ticks";
        expect(c.stats().layerSteps == 5_u);
    };

    "at most one layer step per tick"_test = [] {
        auto textures = MockTileTextureManager::create();
        TileCache::Config config;
        config.fps = 10.0f;
        auto cache = makeCache(textures, 1, 8, CycleMode::Waves, config);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        c.tick(0.0);
        c.tick(1000.0);  // ten intervals late
        expect(c.currentLayer() == 1_u);
    };

    "planes layer cycling stays in range and reverses at the ends"_test = [] {
        auto textures = MockTileTextureManager::create();
        TileCache::Config config;
        config.fps = 20.0f;
        auto cache = makeCache(textures, 2, 4, CycleMode::Planes, config);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        const uint32_t expected[] = {1, 2, 3, 2, 1, 0, 1, 2, 3, 2, 1, 0, 1};
        c.tick(0.0);
        int previousDirection = c.direction();
        for (size_t k = 0; k < std::size(expected); ++k) {
            c.tick(static_cast<double>(k + 1) * 50.0);
            uint32_t layer = c.currentLayer();
            expect(layer == expected[k]);
            expect(layer <= 3_u);
            if (c.direction() != previousDirection) {
                expect(layer == 0_u || layer == 3_u) << "Reverses only at a boundary";
                previousDirection = c.direction();
            }
        }
    };

    "planes with irregular tick spacing never leaves the range"_test = [] {
        auto textures = MockTileTextureManager::create();
        TileCache::Config config;
        config.fps = 30.0f;
        auto cache = makeCache(textures, 1, 3, CycleMode::Planes, config);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        double now = 0.0;
        for (int k = 0; k < 500; ++k) {
            now += static_cast<double>((k * 37) % 90);
            c.tick(now);
            expect(c.currentLayer() <= 2_u);
        }
    };

    "setLayer clamps to the last layer"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 1, 6, CycleMode::Planes);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        c.setLayer(100);
        expect(c.currentLayer() == 5_u);
        expect(c.direction() == -1) << "At the top, heading down";
        c.setLayer(0);
        expect(c.direction() == 1);
    };

    "single-layer sets do not cycle"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 3, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;
        c.tick(0.0);
        c.tick(10000.0);
        expect(c.currentLayer() == 0_u);
        expect(c.layerCyclePeriod() == 0.0);
    };

    "cycle period and undulation period"_test = [] {
        auto textures = MockTileTextureManager::create();
        TileCache::Config config;
        config.fps = 30.0f;
        auto waves = makeCache(textures, 1, 60, CycleMode::Waves, config);
        auto planes = makeCache(textures, 1, 16, CycleMode::Planes, config);
        if (!waves || !planes) { expect(false); return; }

        expect(std::fabs((*waves)->layerCyclePeriod() - 2.0) < 1e-9);
        expect(std::fabs((*waves)->optimalUndulationPeriod(3.0) - 4.0) < 1e-9) << "round(1.5) cycles";
        expect(std::fabs((*planes)->layerCyclePeriod() - 1.0) < 1e-9) << "2 (N - 1) / fps";
        expect(std::fabs((*planes)->optimalUndulationPeriod(3.0) - 3.0) < 1e-9);
    };

    //=========================================================================
    // Flow
    //=========================================================================

    "flow offset integrates speed over time"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 4, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        c.setFlowSpeed(0.5f);
        c.tick(0.0);
        c.tick(1000.0);
        expect(c.flowOffset() == 0.0) << "Flow disabled";

        expect(c.setFlowEnabled(true));
        expect(!c.setFlowEnabled(true)) << "No change";
        expect(c.flowActive());
        c.tick(1500.0);
        expect(std::fabs(c.flowOffset() - 0.25) < 1e-9);
    };

    "wrapFlowOffset moves whole tiles in both directions"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 5, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        c.setFlowEnabled(true);
        c.setFlowSpeed(1.0f);
        c.tick(0.0);
        c.tick(3400.0);
        c.wrapFlowOffset(3);
        expect(c.tileFlowOffset() == 3_u);
        expect(std::fabs(c.flowOffset() - 0.4) < 1e-9);

        c.wrapFlowOffset(-4);
        expect(c.tileFlowOffset() == 4_u) << "(3 - 4) mod 5";
        expect(std::fabs(c.flowOffset() - 4.4) < 1e-9);

        c.wrapFlowOffset(12);
        expect(c.tileFlowOffset() == 1_u) << "(4 + 12) mod 5";
    };

    "disabling flow resets both offsets"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 3, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        c.setFlowEnabled(true);
        c.setFlowSpeed(2.0f);
        c.tick(0.0);
        c.tick(700.0);
        c.wrapFlowOffset(1);
        expect(c.setFlowEnabled(false));
        expect(c.flowOffset() == 0.0);
        expect(c.tileFlowOffset() == 0_u);
    };

    "zero speed keeps flow inactive"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 3, 1);
        if (!cache) { expect(false) << error_msg(cache); return; }
        (*cache)->setFlowEnabled(true);
        (*cache)->setFlowSpeed(0.0f);
        expect(!(*cache)->flowActive());
    };

    //=========================================================================
    // Dispose
    //=========================================================================

    "dispose releases textures and is idempotent"_test = [] {
        auto textures = MockTileTextureManager::create();
        auto cache = makeCache(textures, 4, 2);
        if (!cache) { expect(false) << error_msg(cache); return; }
        auto& c = **cache;

        auto m = c.getMaterial(1);
        expect(m.has_value());

        expect(c.dispose().has_value());
        expect(textures->liveTextureCount() == 0_u);
        expect(c.lifecycleState() == LifecycleState::Disposed);
        expect(!c.resolve(*m).has_value());
        expect(c.dispose().has_value()) << "Second dispose is a no-op";
        expect(textures->releaseCalls() == 4_i);

        auto after = c.getMaterial(1);
        expect(!after);
        expect(error_kind(after) == ErrorKind::State);
    };

    "destroying the cache releases its textures"_test = [] {
        auto textures = MockTileTextureManager::create();
        {
            auto cache = makeCache(textures, 3, 1);
            expect(cache.has_value());
            expect(textures->liveTextureCount() == 3_u);
        }
        expect(textures->liveTextureCount() == 0_u);
    };
};
