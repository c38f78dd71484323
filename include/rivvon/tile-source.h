#pragma once

#include <rivvon/result.hpp>
#include <rivvon/tile-set.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rivvon {

struct RemoteTileConfig {
    std::string apiBase = "https://api.rivvon.ca";
    std::string cdnBase = "https://cdn.rivvon.ca";
    uint32_t timeoutMs = 30000;
    std::string userAgent = "rivvon/1.0";
};

/**
 * TileSource supplies a tile set: its description (tile count, layer count,
 * cycling mode) and the encoded bytes of each tile.
 *
 * Sources may block (disk, network). They are only used while loading, never
 * from the per-frame tick.
 */
class TileSource {
public:
    using Ptr = std::shared_ptr<TileSource>;

    virtual ~TileSource() = default;

    virtual Result<TileSetInfo> describe() = 0;
    virtual Result<std::vector<uint8_t>> fetchTile(const TileSetInfo& info, uint32_t index) = 0;

    // Human readable origin for logs
    virtual std::string label() const = 0;

    // Local store or unpacked archive: metadata.json/.yaml + N.ktx2|png|jpg
    static Result<Ptr> createDirectory(const std::filesystem::path& dir) noexcept;

    // Tiles already in memory (bundled assets, tests)
    static Ptr createMemory(TileSetInfo info, std::vector<std::vector<uint8_t>> tiles) noexcept;

    // GET {apiBase}/textures/{id}, then each tile url
    static Result<Ptr> createRemote(const RemoteTileConfig& config, const std::string& textureId) noexcept;

    // Descriptor already fetched (e.g. by a texture browser)
    static Result<Ptr> createRemote(const RemoteTileConfig& config, TileSetInfo descriptor) noexcept;

    // Parse a texture set document (remote API JSON or local metadata)
    static Result<TileSetInfo> parseDescriptor(const std::string& text,
                                               const std::string& cdnBase = RemoteTileConfig{}.cdnBase);
};

/**
 * Fetched and decoded tiles, not yet on the GPU.
 * Produced off the frame thread; consumed by TileCache::create.
 */
struct TileSetData {
    TileSetInfo info;
    std::vector<DecodedTile> tiles;

    uint32_t layerCount() const { return info.layerCount; }

    // Downloading progress per fetched tile, then Building per decoded tile.
    // Any failure is a ResourceError ("tiles unavailable").
    static Result<TileSetData> load(TileSource& source, const ProgressCallback& onProgress = {});
};

} // namespace rivvon
