#pragma once

#include <rivvon/config.h>
#include <rivvon/frame-capture.h>
#include <rivvon/path-processor.h>
#include <rivvon/render-loop.h>
#include <rivvon/ribbon-renderer.h>
#include <rivvon/ribbon-series.h>
#include <rivvon/tile-cache.h>
#include <rivvon/tile-set-loader.h>
#include <rivvon/viewer-state.h>
#include <rivvon/webgpu-context.h>
#include <rivvon/webgpu-mesh-buffer-manager.h>
#include <rivvon/webgpu-tile-texture-manager.h>
#include <GLFW/glfw3.h>
#include <uv.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace rivvon {

// What a build produced
struct SeriesHandle {
    size_t ribbonCount = 0;
    uint64_t segmentCount = 0;
    size_t skippedPaths = 0;
    bool pending = false;  // no tile set yet; built when the first one is installed
};

/**
 * Viewer is the application root: window, GPU, tile cache, ribbon series and
 * render loop, plus the operations an embedding UI drives.
 *
 * Every method must be called on the frame thread. Remote loads fetch and
 * decode on a worker; the finished tile set is installed on the frame thread
 * through a libuv async handle.
 */
class Viewer {
public:
    using Ptr = std::shared_ptr<Viewer>;

    static Result<Ptr> create(Config::Ptr config) noexcept;

    ~Viewer();

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    // Runs the event loop until the window closes
    int run() noexcept;
    void requestClose() noexcept;

    // =========================================================================
    // Ribbons
    // =========================================================================

    // Raw stroke in screen space: normalized, smoothed, resampled to ~square tiles
    Result<SeriesHandle> buildRibbon(const PointSequence& points, float width);

    // Paths normalized together so their arrangement is kept
    Result<SeriesHandle> buildRibbonSeries(const PathSet& paths, float width);

    // =========================================================================
    // Animation
    // =========================================================================
    Result<void> setFlowState(FlowState state);

    // =========================================================================
    // Tile sets
    // =========================================================================

    // Blocking fetch + decode + upload, then swap
    Result<void> loadTextures(TileSource& source);

    // Fetch + decode on a worker, swap on the frame thread when done.
    // onProgress runs on the worker thread.
    Result<void> loadTexturesFromRemote(TileSetInfo descriptor, ProgressCallback onProgress = {});
    Result<void> loadTexturesFromRemote(const std::string& textureId, ProgressCallback onProgress = {});

    // =========================================================================
    // Export
    // =========================================================================

    // PNG of the current frame at the render size
    Result<std::vector<uint8_t>> exportCurrentFrame();

    // WebM of `seconds` at `fps`, rendered at a fixed timestep
    Result<std::vector<uint8_t>> exportClip(double seconds, uint32_t fps);

    // =========================================================================
    // Accessors
    // =========================================================================
    ViewerState& state() noexcept { return _state; }
    const ViewerState& state() const noexcept { return _state; }
    Config::Ptr config() const noexcept { return _config; }
    TileCache::Ptr tileCache() const noexcept { return _cache; }
    RibbonSeries::Ptr series() const noexcept { return _series; }
    RenderLoop::Ptr renderLoop() const noexcept { return _loop; }
    uv_loop_t* eventLoop() const noexcept { return _uvLoop; }

private:
    explicit Viewer(Config::Ptr config) noexcept;

    Result<void> init() noexcept;
    Result<void> initWindow() noexcept;
    Result<void> initGpu() noexcept;
    Result<void> initEventLoop() noexcept;
    void shutdownEventLoop() noexcept;

    TileCache::Config cacheConfig() const;
    RemoteTileConfig remoteConfig() const;
    void applyFlowState(TileCache& cache) const;

    // Swap in a loaded tile set; on failure the current one stays active
    Result<void> installTileSet(TileSetData data);
    Result<SeriesHandle> build(const PathSet& paths, float width);
    SeriesHandle describeSeries() const;
    Result<void> ensureLoopRunning();
    Result<void> startRemoteLoad(TileSource::Ptr source, ProgressCallback onProgress);

    static void onPollTimer(uv_timer_t* handle);
    static void onLoadAsync(uv_async_t* handle);

    Config::Ptr _config;
    ViewerState _state;
    PathProcessor _paths;

    GLFWwindow* _window = nullptr;
    uint32_t _width = 0;
    uint32_t _height = 0;

    WebGPUContext::Ptr _ctx;
    WebGPUTileTextureManager::Ptr _textures;
    WebGPUMeshBufferManager::Ptr _meshes;
    RibbonRenderer::Ptr _renderer;
    FrameCapture::Ptr _capture;

    TileCache::Ptr _cache;
    RibbonSeries::Ptr _series;
    RenderLoop::Ptr _loop;
    FrameScheduler::Ptr _scheduler;
    TileSetLoader::Ptr _loader;

    // requested before any tile set was installed
    PathSet _pendingPaths;
    float _pendingWidth = 0.0f;

    uv_loop_t* _uvLoop = nullptr;
    uv_timer_t* _pollTimer = nullptr;
    uv_async_t* _loadAsync = nullptr;
};

} // namespace rivvon
