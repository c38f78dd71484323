//=============================================================================
// RenderLoop Unit Tests
//
// Covers: start/stop state machine, per-frame ordering (cache tick, flow
// swap, geometry update, callback, draw), failure handling, manual ticks
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "rivvon/render-loop.h"
#include "harness/mock_gpu.h"
#include <cmath>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace rivvon;
using namespace rivvon::test;

namespace {

class MockFrameRenderer : public FrameRenderer {
public:
    Result<void> drawFrame(const RibbonSeries& series, const TileCache& cache) override {
        _draw_count++;
        _last_segments = series.totalSegmentCount();
        _last_tile_offset = cache.tileFlowOffset();
        if (_log) _log->push_back("draw");
        if (_fail_at_draw > 0 && _draw_count == _fail_at_draw) {
            return Err(ErrorKind::Resource, "mock: device lost");
        }
        return Ok();
    }

    int drawCount() const { return _draw_count; }
    uint64_t lastSegments() const { return _last_segments; }
    uint32_t lastTileOffset() const { return _last_tile_offset; }
    void failAtDraw(int n) { _fail_at_draw = n; }
    void setLog(std::vector<std::string>* log) { _log = log; }

private:
    int _draw_count = 0;
    int _fail_at_draw = 0;
    uint64_t _last_segments = 0;
    uint32_t _last_tile_offset = 0;
    std::vector<std::string>* _log = nullptr;
};

struct LoopFixture {
    MockTileTextureManager::Ptr textures = MockTileTextureManager::create();
    MockMeshBufferManager::Ptr meshes = MockMeshBufferManager::create();
    ManualFrameScheduler::Ptr scheduler = ManualFrameScheduler::create();
    std::shared_ptr<MockFrameRenderer> renderer = std::make_shared<MockFrameRenderer>();
    TileCache::Ptr cache;
    RibbonSeries::Ptr series;
    RenderLoop::Ptr loop;

    explicit LoopFixture(TileCache::Config config = {}) {
        auto c = makeCache(textures, 4, 3, CycleMode::Waves, config);
        if (c) cache = *c;
        auto s = RibbonSeries::create(meshes);
        if (s) series = *s;
        if (cache && series) {
            series->setTileCache(cache);
            if (!series->buildFromMultiplePaths({straightPath(5)}, 1.0f)) {
                series.reset();
            }
        }
        auto l = RenderLoop::create(scheduler, renderer);
        if (l) loop = *l;
        if (loop) loop->setTileCache(cache).setRibbonSeries(series);
    }

    bool ok() const { return cache && series && loop; }
};

} // namespace

suite render_loop_tests = [] {
    "create needs a scheduler and a renderer"_test = [] {
        auto noScheduler = RenderLoop::create(nullptr, std::make_shared<MockFrameRenderer>());
        expect(!noScheduler);
        expect(error_kind(noScheduler) == ErrorKind::State);

        auto noRenderer = RenderLoop::create(ManualFrameScheduler::create(), nullptr);
        expect(!noRenderer);
    };

    "start needs a cache and a series"_test = [] {
        auto loop = RenderLoop::create(ManualFrameScheduler::create(), std::make_shared<MockFrameRenderer>());
        if (!loop) { expect(false) << error_msg(loop); return; }
        auto res = (*loop)->start();
        expect(!res);
        expect(error_kind(res) == ErrorKind::State);
        expect((*loop)->state() == RenderLoopState::Stopped);
    };

    "start, pump frames, stop"_test = [] {
        LoopFixture f;
        if (!f.ok()) { expect(false); return; }

        double lastElapsed = -1.0;
        expect(f.loop->start([&](double elapsed) { lastElapsed = elapsed; }).has_value());
        expect(f.loop->isRunning());
        expect(f.scheduler->scheduled());

        auto again = f.loop->start();
        expect(!again) << "Already running";
        expect(error_kind(again) == ErrorKind::State);

        f.scheduler->pump(1000.0);
        f.scheduler->pump(1016.0);
        f.scheduler->pump(1500.0);
        expect(f.loop->frameCount() == 3_u);
        expect(f.renderer->drawCount() == 3_i);
        expect(f.renderer->lastSegments() == 4_u);
        expect(std::fabs(lastElapsed - 0.5) < 1e-9) << "Elapsed from the first frame";
        expect(std::fabs(f.loop->elapsedSeconds() - 0.5) < 1e-9);

        expect(f.loop->stop().has_value());
        expect(!f.loop->isRunning());
        expect(!f.scheduler->scheduled());
        expect(!f.scheduler->pump(2000.0));
        expect(f.loop->frameCount() == 3_u);
        expect(f.loop->stop().has_value()) << "Stop when stopped is a no-op";
    };

    "each frame ticks the cache before the flow swap and the draw"_test = [] {
        TileCache::Config config;
        config.flowEnabled = true;
        config.flowSpeed = 2.0f;
        config.fps = 10.0f;
        LoopFixture f(config);
        if (!f.ok()) { expect(false); return; }

        std::vector<std::string> log;
        f.renderer->setLog(&log);
        uint32_t tileOffsetSeenByCallback = 99;
        expect(f.loop->start([&](double) {
            log.push_back("callback");
            tileOffsetSeenByCallback = f.cache->tileFlowOffset();
        }).has_value());

        f.scheduler->pump(0.0);
        f.scheduler->pump(600.0);  // offset 1.2 -> swap by one tile this frame

        expect(f.cache->currentLayer() == 1_u) << "Cache ticked";
        expect(tileOffsetSeenByCallback == 1_u) << "Swap done before the callback";
        expect(f.renderer->lastTileOffset() == 1_u);
        expect(f.series->flowSwapCount() == 1_u);
        expect(log.size() == 4_u);
        expect(log[0] == "callback" && log[1] == "draw" && log[2] == "callback" && log[3] == "draw");
    };

    "a failing frame stops the loop and keeps the error"_test = [] {
        LoopFixture f;
        if (!f.ok()) { expect(false); return; }
        f.renderer->failAtDraw(2);

        expect(f.loop->start().has_value());
        f.scheduler->pump(0.0);
        f.scheduler->pump(16.0);
        expect(f.loop->state() == RenderLoopState::Stopped);
        expect(!f.scheduler->scheduled());
        expect(f.loop->frameCount() == 1_u);

        auto error = f.loop->lastError();
        expect(error.has_value());
        if (error) {
            expect(error->kind() == ErrorKind::Resource);
            expect(error->to_string().find("device lost") != std::string::npos);
        }

        expect(f.loop->start().has_value()) << "Restart clears the error";
        expect(!f.loop->lastError().has_value());
    };

    "manual ticks work while stopped"_test = [] {
        LoopFixture f;
        if (!f.ok()) { expect(false); return; }

        expect(f.loop->tick(0.0).has_value());
        expect(f.loop->tick(33.0).has_value());
        expect(f.loop->frameCount() == 2_u);
        expect(f.renderer->drawCount() == 2_i);
        expect(f.loop->state() == RenderLoopState::Stopped);
    };

    "advance runs the frame without drawing"_test = [] {
        TileCache::Config config;
        config.fps = 10.0f;
        LoopFixture f(config);
        if (!f.ok()) { expect(false); return; }

        expect(f.loop->advance(0.0).has_value());
        expect(f.loop->advance(100.0).has_value());
        expect(f.cache->currentLayer() == 1_u);
        expect(f.renderer->drawCount() == 0_i);
        expect(f.loop->frameCount() == 0_u);
        expect(f.meshes->vertexWrites() == 8_i) << "Geometry updated both times";
    };

    "a disposed cache fails the frame"_test = [] {
        LoopFixture f;
        if (!f.ok()) { expect(false); return; }
        expect(f.cache->dispose().has_value());

        auto res = f.loop->tick(0.0);
        expect(!res);
        expect(error_kind(res) == ErrorKind::State);
        expect(f.renderer->drawCount() == 0_i);
    };

    "destroying a running loop cancels the schedule"_test = [] {
        LoopFixture f;
        if (!f.ok()) { expect(false); return; }
        expect(f.loop->start().has_value());
        f.loop.reset();
        expect(!f.scheduler->scheduled());
    };
};
