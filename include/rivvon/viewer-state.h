#pragma once

#include <rivvon/result.hpp>
#include <rivvon/tile-set.h>
#include <cstdint>
#include <mutex>
#include <string>

namespace rivvon {

enum class FlowState {
    Off,
    Forward,
    Backward,
};

const char* toString(FlowState state);
Result<FlowState> parseFlowState(const std::string& name);

struct LoadProgress {
    bool loading = false;
    LoadStage stage = LoadStage::Downloading;
    uint32_t completed = 0;
    uint32_t total = 0;
    std::string error;  // last failure, empty on success
};

/**
 * Animation and UI state owned by the application root and shared by
 * reference with the render loop and any UI layer.
 *
 * Load progress is written from the loader thread and guarded; everything
 * else is frame-thread only.
 */
class ViewerState {
public:
    FlowState flowState() const { return _flowState; }
    void setFlowState(FlowState state) { _flowState = state; }

    // magnitude used by forward/backward
    float flowSpeed() const { return _flowSpeed; }
    void setFlowSpeed(float speed) { _flowSpeed = speed < 0.0f ? -speed : speed; }

    // signed tiles/second for the current flow state
    float signedFlowSpeed() const;

    float ribbonWidth() const { return _ribbonWidth; }
    void setRibbonWidth(float width) { _ribbonWidth = width; }

    const std::string& tileSetName() const { return _tileSetName; }
    const std::string& thumbnailUrl() const { return _thumbnailUrl; }
    void setTileSet(const TileSetInfo& info);

    LoadProgress loadProgress() const;
    void beginLoad();
    void setLoadProgress(LoadStage stage, uint32_t completed, uint32_t total);
    void finishLoad(const std::string& error = {});

private:
    FlowState _flowState = FlowState::Off;
    float _flowSpeed = 0.25f;
    float _ribbonWidth = 1.2f;
    std::string _tileSetName;
    std::string _thumbnailUrl;

    mutable std::mutex _progressMutex;
    LoadProgress _progress;
};

} // namespace rivvon
