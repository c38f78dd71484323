#include <rivvon/viewer-state.h>

namespace rivvon {

const char* toString(FlowState state) {
    switch (state) {
        case FlowState::Off:      return "off";
        case FlowState::Forward:  return "forward";
        case FlowState::Backward: return "backward";
    }
    return "off";
}

Result<FlowState> parseFlowState(const std::string& name) {
    if (name == "off") return Ok(FlowState::Off);
    if (name == "forward") return Ok(FlowState::Forward);
    if (name == "backward") return Ok(FlowState::Backward);
    return Err<FlowState>("unknown flow state '" + name + "' (off, forward, backward)");
}

float ViewerState::signedFlowSpeed() const {
    switch (_flowState) {
        case FlowState::Forward:  return _flowSpeed;
        case FlowState::Backward: return -_flowSpeed;
        case FlowState::Off:      break;
    }
    return 0.0f;
}

void ViewerState::setTileSet(const TileSetInfo& info) {
    _tileSetName = info.name;
    _thumbnailUrl = info.thumbnailUrl;
}

LoadProgress ViewerState::loadProgress() const {
    std::lock_guard<std::mutex> lock(_progressMutex);
    return _progress;
}

void ViewerState::beginLoad() {
    std::lock_guard<std::mutex> lock(_progressMutex);
    _progress = LoadProgress{};
    _progress.loading = true;
}

void ViewerState::setLoadProgress(LoadStage stage, uint32_t completed, uint32_t total) {
    std::lock_guard<std::mutex> lock(_progressMutex);
    _progress.stage = stage;
    _progress.completed = completed;
    _progress.total = total;
}

void ViewerState::finishLoad(const std::string& error) {
    std::lock_guard<std::mutex> lock(_progressMutex);
    _progress.loading = false;
    _progress.error = error;
}

} // namespace rivvon
