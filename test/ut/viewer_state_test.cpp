//=============================================================================
// ViewerState Unit Tests
//
// Covers: flow state names, signed flow speed, tile set display info,
// load progress lifecycle
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "rivvon/viewer-state.h"

using namespace boost::ut;
using namespace rivvon;

suite viewer_state_tests = [] {
    "flow state names"_test = [] {
        for (auto state : {FlowState::Off, FlowState::Forward, FlowState::Backward}) {
            auto parsed = parseFlowState(toString(state));
            expect(parsed.has_value());
            expect(parsed && *parsed == state);
        }
        auto bad = parseFlowState("sideways");
        expect(!bad);
        expect(error_msg(bad).find("sideways") != std::string::npos);
        expect(!parseFlowState("Forward")) << "Names are lower case";
    };

    "signed flow speed follows the flow state"_test = [] {
        ViewerState state;
        expect(state.flowState() == FlowState::Off);
        expect(state.flowSpeed() == 0.25_f);
        expect(state.signedFlowSpeed() == 0.0_f);

        state.setFlowSpeed(0.5f);
        state.setFlowState(FlowState::Forward);
        expect(state.signedFlowSpeed() == 0.5_f);

        state.setFlowState(FlowState::Backward);
        expect(state.signedFlowSpeed() == -0.5_f);

        state.setFlowSpeed(-2.0f);
        expect(state.flowSpeed() == 2.0_f) << "Speed is stored as a magnitude";
        expect(state.signedFlowSpeed() == -2.0_f);
    };

    "tile set display info"_test = [] {
        ViewerState state;
        expect(state.ribbonWidth() == 1.2_f);
        state.setRibbonWidth(0.8f);
        expect(state.ribbonWidth() == 0.8_f);

        TileSetInfo info;
        info.name = "Aurora";
        info.thumbnailUrl = "https://cdn.example/aurora.jpg";
        state.setTileSet(info);
        expect(state.tileSetName() == "Aurora");
        expect(state.thumbnailUrl() == "https://cdn.example/aurora.jpg");
    };

    "load progress lifecycle"_test = [] {
        ViewerState state;
        expect(!state.loadProgress().loading);

        state.finishLoad("tiles unavailable");
        state.beginLoad();
        auto started = state.loadProgress();
        expect(started.loading);
        expect(started.error.empty()) << "A new load clears the previous error";
        expect(started.completed == 0_u);

        state.setLoadProgress(LoadStage::Building, 3, 7);
        auto midway = state.loadProgress();
        expect(midway.stage == LoadStage::Building);
        expect(midway.completed == 3_u);
        expect(midway.total == 7_u);

        state.finishLoad();
        auto done = state.loadProgress();
        expect(!done.loading);
        expect(done.error.empty());
        expect(done.total == 7_u);

        state.beginLoad();
        state.finishLoad("tiles unavailable: tile 2");
        expect(state.loadProgress().error == "tiles unavailable: tile 2");
    };
};
