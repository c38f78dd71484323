//=============================================================================
// TileSetLoader Unit Tests
//
// Covers: background load, single take of the result, progress and ready
// callbacks, start errors
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "rivvon/tile-set-loader.h"
#include "harness/mock_gpu.h"
#include <atomic>

using namespace boost::ut;
using namespace rivvon;
using namespace rivvon::test;

suite tile_set_loader_tests = [] {
    "load runs in the background and is taken once"_test = [] {
        auto loader = TileSetLoader::create();
        expect(!loader->take().has_value()) << "Nothing started yet";

        std::atomic<int> ready{0};
        std::atomic<int> progress{0};
        auto res = loader->start(makeKtx2Source(4, 2),
                                 [&](LoadStage, uint32_t, uint32_t) { progress++; },
                                 [&]() { ready++; });
        expect(res.has_value()) << error_msg(res);
        loader->wait();

        expect(!loader->busy());
        expect(ready.load() == 1_i);
        expect(progress.load() == 10_i) << "Downloading and building, 0..4 each";

        auto result = loader->take();
        expect(result.has_value());
        if (result) {
            expect(result->has_value()) << error_msg(*result);
            if (*result) {
                expect((*result)->tiles.size() == 4_u);
                expect((*result)->layerCount() == 2_u);
            }
        }
        expect(!loader->take().has_value()) << "Result is handed out once";
    };

    "a failed load is reported through the result"_test = [] {
        auto loader = TileSetLoader::create();
        TileSetInfo info;
        info.name = "broken";
        auto source = TileSource::createMemory(info, {std::vector<uint8_t>(16, 0x00)});

        expect(loader->start(source, {}, {}).has_value());
        loader->wait();

        auto result = loader->take();
        expect(result.has_value());
        if (result) {
            expect(!result->has_value());
            expect(error_kind(*result) == ErrorKind::Resource);
            expect(error_msg(*result).find("tiles unavailable") != std::string::npos);
        }
    };

    "start errors"_test = [] {
        auto loader = TileSetLoader::create();
        auto noSource = loader->start(nullptr, {}, {});
        expect(!noSource);
        expect(error_kind(noSource) == ErrorKind::State);
    };

    "loader can be reused after a load"_test = [] {
        auto loader = TileSetLoader::create();
        expect(loader->start(makeKtx2Source(2, 1), {}, {}).has_value());
        loader->wait();
        expect(loader->take().has_value());

        expect(loader->start(makeKtx2Source(3, 1), {}, {}).has_value());
        loader->wait();
        auto second = loader->take();
        expect(second.has_value() && second->has_value());
        if (second && *second) {
            expect((*second)->tiles.size() == 3_u);
        }
    };
};
