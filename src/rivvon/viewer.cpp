#include <rivvon/viewer.h>
#include <rivvon/frame-encoding.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace rivvon {

// =============================================================================
// Construction
// =============================================================================

Viewer::Viewer(Config::Ptr config) noexcept : _config(std::move(config)) {}

Result<Viewer::Ptr> Viewer::create(Config::Ptr config) noexcept {
    if (!config) {
        return Err<Ptr>(ErrorKind::State, "Viewer: no configuration");
    }
    auto viewer = Ptr(new Viewer(std::move(config)));
    if (auto res = viewer->init(); !res) {
        return Err<Ptr>("Failed to initialize Viewer", res);
    }
    return Ok(std::move(viewer));
}

Result<void> Viewer::init() noexcept {
    PathProcessor::Config pathConfig;
    pathConfig.smoothSamples = _config->get<size_t>(Config::KEY_PATH_SMOOTH_SAMPLES, 150);
    pathConfig.targetSize = _config->get<float>(Config::KEY_PATH_TARGET_SIZE, 8.0f);
    pathConfig.minDistance = _config->get<float>(Config::KEY_PATH_MIN_DISTANCE, 0.001f);
    _paths = PathProcessor(pathConfig);

    _state.setFlowSpeed(_config->get<float>(Config::KEY_FLOW_SPEED, 0.25f));
    _state.setRibbonWidth(_config->get<float>(Config::KEY_RIBBON_WIDTH, 1.2f));
    auto flow = parseFlowState(_config->get<std::string>(Config::KEY_FLOW_STATE, "off"));
    if (!flow) {
        return Err("Viewer: " + std::string(Config::KEY_FLOW_STATE), flow);
    }
    _state.setFlowState(*flow);

    if (auto res = initWindow(); !res) {
        return res;
    }
    if (auto res = initGpu(); !res) {
        return res;
    }
    if (auto res = initEventLoop(); !res) {
        return res;
    }

    _loader = TileSetLoader::create();
    yinfo("Viewer: ready {}x{}", _width, _height);
    return Ok();
}

Result<void> Viewer::initWindow() noexcept {
    if (!glfwInit()) {
        return Err(ErrorKind::Resource, "Failed to initialize GLFW");
    }
    _width = _config->get<uint32_t>(Config::KEY_RENDER_WIDTH, 1280);
    _height = _config->get<uint32_t>(Config::KEY_RENDER_HEIGHT, 720);

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    _window = glfwCreateWindow(static_cast<int>(_width), static_cast<int>(_height), "rivvon", nullptr, nullptr);
    if (!_window) {
        return Err(ErrorKind::Resource, "Failed to create window");
    }
    glfwSetWindowUserPointer(_window, this);
    glfwSetFramebufferSizeCallback(_window, [](GLFWwindow* window, int width, int height) {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(window));
        if (width <= 0 || height <= 0) return;
        self->_width = static_cast<uint32_t>(width);
        self->_height = static_cast<uint32_t>(height);
        if (self->_ctx) {
            self->_ctx->resize(self->_width, self->_height);
        }
    });
    glfwSetKeyCallback(_window, [](GLFWwindow* window, int key, int, int action, int) {
        if (action != GLFW_PRESS) return;
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(window));
        FlowState next = self->_state.flowState();
        switch (key) {
            case GLFW_KEY_ESCAPE: self->requestClose(); return;
            case GLFW_KEY_0: next = FlowState::Off; break;
            case GLFW_KEY_RIGHT: next = FlowState::Forward; break;
            case GLFW_KEY_LEFT: next = FlowState::Backward; break;
            default: return;
        }
        if (auto res = self->setFlowState(next); !res) {
            ywarn("Viewer: {}", error_msg(res));
        }
    });
    return Ok();
}

Result<void> Viewer::initGpu() noexcept {
    auto ctx = WebGPUContext::create(_window, _width, _height);
    if (!ctx) return Err("Viewer: WebGPU context", ctx);
    _ctx = *ctx;

    auto textures = WebGPUTileTextureManager::create(_ctx);
    if (!textures) return Err("Viewer: texture manager", textures);
    _textures = *textures;

    auto meshes = WebGPUMeshBufferManager::create(_ctx);
    if (!meshes) return Err("Viewer: mesh buffer manager", meshes);
    _meshes = *meshes;

    RibbonRenderer::Config renderConfig;
    renderConfig.cameraDistance = _config->get<float>(Config::KEY_RENDER_CAMERA_DISTANCE, 14.0f);
    renderConfig.cameraElevation = _config->get<float>(Config::KEY_RENDER_CAMERA_ELEVATION, 35.0f);
    auto renderer = RibbonRenderer::create(_ctx, _textures, _meshes, renderConfig);
    if (!renderer) return Err("Viewer: renderer", renderer);
    _renderer = *renderer;

    auto capture = FrameCapture::create(_ctx, _renderer);
    if (!capture) return Err("Viewer: frame capture", capture);
    _capture = *capture;

    Ribbon::Config ribbonConfig;
    ribbonConfig.subdivisions = _config->get<uint32_t>(Config::KEY_RIBBON_SUBDIVISIONS, 8);
    ribbonConfig.waveAmplitude = _config->get<float>(Config::KEY_WAVE_AMPLITUDE, 0.075f);
    ribbonConfig.waveFrequency = _config->get<float>(Config::KEY_WAVE_FREQUENCY, 0.5f);
    ribbonConfig.undulationPeriod = _config->get<double>(Config::KEY_WAVE_UNDULATION_PERIOD, 3.0);
    auto series = RibbonSeries::create(_meshes, ribbonConfig);
    if (!series) return Err("Viewer: ribbon series", series);
    _series = *series;

    return Ok();
}

Viewer::~Viewer() {
    if (_loader) {
        _loader->wait();
    }
    if (_loop) {
        if (auto res = _loop->stop(); !res) {
            ywarn("Viewer: stop: {}", error_msg(res));
        }
    }
    _loop.reset();
    // the uv timer handle closes with the scheduler, before the loop shuts down
    _scheduler.reset();
    shutdownEventLoop();

    if (_series) {
        if (auto res = _series->dispose(); !res) {
            ywarn("Viewer: series dispose: {}", error_msg(res));
        }
    }
    if (_cache) {
        if (auto res = _cache->dispose(); !res) {
            ywarn("Viewer: cache dispose: {}", error_msg(res));
        }
    }
    _series.reset();
    _cache.reset();
    _capture.reset();
    _renderer.reset();
    _meshes.reset();
    _textures.reset();
    _ctx.reset();

    if (_window) {
        glfwDestroyWindow(_window);
        _window = nullptr;
    }
    glfwTerminate();
}

// =============================================================================
// libuv event loop
// =============================================================================

Result<void> Viewer::initEventLoop() noexcept {
    _uvLoop = new uv_loop_t;
    uv_loop_init(_uvLoop);

    // input polling runs even while no tile set is installed
    _pollTimer = new uv_timer_t;
    uv_timer_init(_uvLoop, _pollTimer);
    _pollTimer->data = this;

    // loader thread -> frame thread
    _loadAsync = new uv_async_t;
    uv_async_init(_uvLoop, _loadAsync, onLoadAsync);
    _loadAsync->data = this;

    auto scheduler = FrameScheduler::createUv(_uvLoop, _config->get<double>(Config::KEY_RENDER_FPS, 60.0));
    if (!scheduler) {
        return Err("Viewer: frame scheduler", scheduler);
    }
    _scheduler = *scheduler;

    auto loop = RenderLoop::create(_scheduler, _renderer);
    if (!loop) {
        return Err("Viewer: render loop", loop);
    }
    _loop = *loop;
    _loop->setRibbonSeries(_series);

    ydebug("Viewer: libuv event loop initialized");
    return Ok();
}

void Viewer::shutdownEventLoop() noexcept {
    if (_pollTimer) {
        uv_timer_stop(_pollTimer);
        uv_close(reinterpret_cast<uv_handle_t*>(_pollTimer), nullptr);
    }
    if (_loadAsync) {
        uv_close(reinterpret_cast<uv_handle_t*>(_loadAsync), nullptr);
    }
    if (_uvLoop) {
        // Run loop once to process close callbacks
        uv_run(_uvLoop, UV_RUN_NOWAIT);
        uv_loop_close(_uvLoop);
        delete _uvLoop;
        _uvLoop = nullptr;
    }
    delete _pollTimer;
    _pollTimer = nullptr;
    delete _loadAsync;
    _loadAsync = nullptr;
}

void Viewer::onPollTimer(uv_timer_t* handle) {
    auto* self = static_cast<Viewer*>(handle->data);

    glfwPollEvents();
    if (glfwWindowShouldClose(self->_window)) {
        uv_stop(self->_uvLoop);
        return;
    }
    if (auto error = self->_loop->lastError()) {
        yerror("Viewer: render loop stopped: {}", error->to_string());
        uv_stop(self->_uvLoop);
    }
}

void Viewer::onLoadAsync(uv_async_t* handle) {
    auto* self = static_cast<Viewer*>(handle->data);
    auto result = self->_loader->take();
    if (!result) {
        return;
    }
    if (!*result) {
        yerror("Viewer: tile set load failed: {}", result->error().to_string());
        self->_state.finishLoad(result->error().to_string());
        return;
    }
    if (auto res = self->installTileSet(std::move(**result)); !res) {
        yerror("Viewer: tile set install failed: {}", error_msg(res));
        self->_state.finishLoad(error_msg(res));
        return;
    }
    self->_state.finishLoad();
}

int Viewer::run() noexcept {
    if (auto res = ensureLoopRunning(); !res) {
        ydebug("Viewer: render loop waits for a tile set ({})", error_msg(res));
    }
    uv_timer_start(_pollTimer, onPollTimer, 0, 20);

    yinfo("Viewer: running (ESC to exit, arrows set flow direction, 0 stops flow)");
    uv_run(_uvLoop, UV_RUN_DEFAULT);

    yinfo("Viewer: shutting down after {} frames", _loop->frameCount());
    return _loop->lastError() ? 1 : 0;
}

void Viewer::requestClose() noexcept {
    if (_window) {
        glfwSetWindowShouldClose(_window, GLFW_TRUE);
    }
}

Result<void> Viewer::ensureLoopRunning() {
    if (_loop->isRunning()) {
        return Ok();
    }
    if (!_cache) {
        return Err(ErrorKind::State, "no tile set installed");
    }
    return _loop->start();
}

// =============================================================================
// Configuration
// =============================================================================

TileCache::Config Viewer::cacheConfig() const {
    TileCache::Config config;
    config.fps = _config->get<float>(Config::KEY_TILES_FPS, 30.0f);
    config.rotate90 = _config->get<bool>(Config::KEY_TILES_ROTATE90, true);
    config.flowEnabled = _state.flowState() != FlowState::Off;
    config.flowSpeed = _state.signedFlowSpeed();
    return config;
}

RemoteTileConfig Viewer::remoteConfig() const {
    RemoteTileConfig config;
    config.apiBase = _config->get<std::string>(Config::KEY_TILES_API_BASE, config.apiBase);
    config.cdnBase = _config->get<std::string>(Config::KEY_TILES_CDN_BASE, config.cdnBase);
    config.timeoutMs = _config->get<uint32_t>(Config::KEY_TILES_TIMEOUT_MS, config.timeoutMs);
    return config;
}

void Viewer::applyFlowState(TileCache& cache) const {
    if (_state.flowState() == FlowState::Off) {
        cache.setFlowEnabled(false);
        return;
    }
    cache.setFlowSpeed(_state.signedFlowSpeed());
    cache.setFlowEnabled(true);
}

// =============================================================================
// Ribbons
// =============================================================================

SeriesHandle Viewer::describeSeries() const {
    SeriesHandle handle;
    handle.ribbonCount = _series->ribbonCount();
    handle.segmentCount = _series->totalSegmentCount();
    handle.skippedPaths = _series->skippedPathCount();
    return handle;
}

Result<SeriesHandle> Viewer::build(const PathSet& paths, float width) {
    if (!(width > 0.0f)) {
        return Err<SeriesHandle>(ErrorKind::Construction, "Viewer: ribbon width must be positive");
    }

    // one tile per ~width of arc length
    PathSet resampled;
    resampled.reserve(paths.size());
    for (const auto& path : paths) {
        resampled.push_back(path.size() >= 2 ? _paths.resampleByArcLength(path, width) : path);
    }

    if (!_cache) {
        _pendingPaths = std::move(resampled);
        _pendingWidth = width;
        SeriesHandle handle;
        handle.pending = true;
        yinfo("Viewer: {} paths waiting for a tile set", _pendingPaths.size());
        return Ok(handle);
    }

    auto built = _series->buildFromMultiplePaths(resampled, width, _loop->elapsedSeconds());
    if (!built) {
        return Err<SeriesHandle>("Viewer: build", built);
    }
    _state.setRibbonWidth(width);
    auto handle = describeSeries();
    yinfo("Viewer: {} ribbons, {} segments ({} paths skipped)",
          handle.ribbonCount, handle.segmentCount, handle.skippedPaths);
    return Ok(handle);
}

Result<SeriesHandle> Viewer::buildRibbon(const PointSequence& points, float width) {
    auto stroke = _paths.prepareStroke(points);
    if (!stroke) {
        return Err<SeriesHandle>("Viewer: stroke", stroke);
    }
    return build(PathSet{std::move(*stroke)}, width);
}

Result<SeriesHandle> Viewer::buildRibbonSeries(const PathSet& paths, float width) {
    return build(_paths.prepareMultiPath(paths), width);
}

// =============================================================================
// Animation
// =============================================================================

Result<void> Viewer::setFlowState(FlowState state) {
    _state.setFlowState(state);
    if (_cache) {
        applyFlowState(*_cache);
        // material sets follow on the next frame's updateFlowMaterials
    }
    ydebug("Viewer: flow {}", toString(state));
    return Ok();
}

// =============================================================================
// Tile sets
// =============================================================================

Result<void> Viewer::installTileSet(TileSetData data) {
    const std::string name = data.info.name;
    TileSetInfo info = data.info;

    auto cache = TileCache::create(std::move(data), _textures, cacheConfig());
    if (!cache) {
        return Err("Viewer: tile set '" + name + "'", cache);
    }

    // current ribbons against the new tiles, or the build waiting for them
    Result<size_t> built = _pendingPaths.empty()
        ? _series->switchTileCache(*cache, _loop->elapsedSeconds())
        : _series->setTileCache(*cache).buildFromMultiplePaths(_pendingPaths, _pendingWidth,
                                                                _loop->elapsedSeconds());
    if (!built) {
        if (auto res = (*cache)->dispose(); !res) {
            ywarn("Viewer: discarding new tile set: {}", error_msg(res));
        }
        if (_cache) {
            _series->setTileCache(_cache);
        }
        return Err("Viewer: rebuilding against '" + name + "'", built);
    }
    if (!_pendingPaths.empty()) {
        _state.setRibbonWidth(_pendingWidth);
        _pendingPaths.clear();
    }

    _renderer->invalidateBindings();
    _loop->setTileCache(*cache);
    auto previous = std::exchange(_cache, *cache);
    if (previous) {
        if (auto res = previous->dispose(); !res) {
            ywarn("Viewer: disposing previous tile set: {}", error_msg(res));
        }
    }
    _state.setTileSet(info);

    yinfo("Viewer: tile set '{}' active ({} tiles x {} layers, {} segments)",
          name, _cache->tileCount(), _cache->layerCount(), _series->totalSegmentCount());
    return ensureLoopRunning();
}

Result<void> Viewer::loadTextures(TileSource& source) {
    _state.beginLoad();
    auto data = TileSetData::load(source, [this](LoadStage stage, uint32_t done, uint32_t total) {
        _state.setLoadProgress(stage, done, total);
    });
    if (!data) {
        _state.finishLoad(error_msg(data));
        return Err("Viewer: loading " + source.label(), data);
    }
    auto res = installTileSet(std::move(*data));
    _state.finishLoad(error_msg(res));
    return res;
}

Result<void> Viewer::startRemoteLoad(TileSource::Ptr source, ProgressCallback onProgress) {
    _state.beginLoad();
    auto res = _loader->start(
        std::move(source),
        [this, onProgress = std::move(onProgress)](LoadStage stage, uint32_t done, uint32_t total) {
            _state.setLoadProgress(stage, done, total);
            if (onProgress) {
                onProgress(stage, done, total);
            }
        },
        [this]() { uv_async_send(_loadAsync); });
    if (!res) {
        _state.finishLoad(error_msg(res));
        return Err("Viewer: remote load", res);
    }
    return Ok();
}

Result<void> Viewer::loadTexturesFromRemote(TileSetInfo descriptor, ProgressCallback onProgress) {
    auto source = TileSource::createRemote(remoteConfig(), std::move(descriptor));
    if (!source) {
        return Err("Viewer: remote source", source);
    }
    return startRemoteLoad(*source, std::move(onProgress));
}

Result<void> Viewer::loadTexturesFromRemote(const std::string& textureId, ProgressCallback onProgress) {
    auto source = TileSource::createRemote(remoteConfig(), textureId);
    if (!source) {
        return Err("Viewer: remote source", source);
    }
    return startRemoteLoad(*source, std::move(onProgress));
}

// =============================================================================
// Export
// =============================================================================

Result<std::vector<uint8_t>> Viewer::exportCurrentFrame() {
    if (!_cache) {
        return Err<std::vector<uint8_t>>(ErrorKind::State, "Viewer::exportCurrentFrame: no tile set installed");
    }
    return _capture->captureFrame(*_series, *_cache, _width, _height);
}

Result<std::vector<uint8_t>> Viewer::exportClip(double seconds, uint32_t fps) {
    if (!_cache) {
        return Err<std::vector<uint8_t>>(ErrorKind::State, "Viewer::exportClip: no tile set installed");
    }
    if (!(seconds > 0.0) || fps == 0) {
        return Err<std::vector<uint8_t>>(ErrorKind::Construction, "Viewer::exportClip: duration and fps must be positive");
    }

    ClipEncoder::Config clipConfig;
    clipConfig.ffmpeg = _config->get<std::string>(Config::KEY_EXPORT_FFMPEG, "ffmpeg");
    clipConfig.width = _width;
    clipConfig.height = _height;
    clipConfig.fps = fps;
    auto encoder = ClipEncoder::create(clipConfig);
    if (!encoder) {
        return Err<std::vector<uint8_t>>("Viewer::exportClip", encoder);
    }

    // fixed timestep: the live loop is paused for the duration
    const bool wasRunning = _loop->isRunning();
    if (auto res = _loop->stop(); !res) {
        return Err<std::vector<uint8_t>>("Viewer::exportClip", res);
    }

    const auto frames = static_cast<uint32_t>(std::ceil(seconds * fps));
    const double startMs = static_cast<double>(uv_hrtime()) / 1e6;
    Result<void> status = Ok();
    for (uint32_t i = 0; i < frames && status; i++) {
        double nowMs = startMs + i * 1000.0 / fps;
        if (auto res = _loop->advance(nowMs); !res) {
            status = Err("frame " + std::to_string(i), res);
            break;
        }
        auto pixels = _capture->readPixels(*_series, *_cache, _width, _height);
        if (!pixels) {
            status = Err("frame " + std::to_string(i), pixels);
            break;
        }
        status = (*encoder)->writeFrame(*pixels);
    }

    auto clip = status ? (*encoder)->finish() : Err<std::vector<uint8_t>>("Viewer::exportClip", status);

    if (wasRunning) {
        if (auto res = _loop->start(); !res) {
            ywarn("Viewer: resuming render loop: {}", error_msg(res));
        }
    }
    if (clip) {
        yinfo("Viewer: exported {} frames at {} fps", frames, fps);
    }
    return clip;
}

} // namespace rivvon
