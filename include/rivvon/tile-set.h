#pragma once

#include <rivvon/result.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace rivvon {

// Layer cycling style of a tile set
enum class CycleMode {
    Waves,   // continuous wrap
    Planes,  // ping-pong
};

const char* toString(CycleMode mode);
Result<CycleMode> parseCycleMode(const std::string& name);

struct TileEntry {
    uint32_t index = 0;
    std::string url;       // empty for local/memory sources
    uint64_t fileSize = 0; // 0 when unknown
};

// Everything known about a tile set before any tile is fetched
struct TileSetInfo {
    std::string id;
    std::string name;
    uint32_t tileCount = 0;
    uint32_t layerCount = 0;   // 0 = take it from the first decoded tile
    CycleMode mode = CycleMode::Waves;
    std::string thumbnailUrl;
    std::vector<TileEntry> tiles;
};

// GPU-facing pixel formats the decoder can produce
enum class TileFormat {
    RGBA8Unorm,
    RGBA8UnormSrgb,
    BC1RGBAUnorm,
    BC1RGBAUnormSrgb,
    BC3RGBAUnorm,
    BC3RGBAUnormSrgb,
    BC7RGBAUnorm,
    BC7RGBAUnormSrgb,
    ETC2RGBA8Unorm,
    ETC2RGBA8UnormSrgb,
    ASTC4x4Unorm,
    ASTC4x4UnormSrgb,
};

const char* toString(TileFormat format);

struct TileFormatInfo {
    uint32_t blockWidth;
    uint32_t blockHeight;
    uint32_t bytesPerBlock;
};

TileFormatInfo formatInfo(TileFormat format);

struct DecodedLevel {
    uint32_t width = 0;
    uint32_t height = 0;
    // all layers of this level, tightly packed layer after layer
    std::vector<uint8_t> data;
};

// One decoded tile: a layered image with optional mip levels
struct DecodedTile {
    TileFormat format = TileFormat::RGBA8Unorm;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t layers = 1;
    std::vector<DecodedLevel> levels;

    // bytes per row / per layer for a level, as uploaded
    uint32_t bytesPerRow(uint32_t level) const;
    uint32_t rowsPerImage(uint32_t level) const;
    uint64_t bytesPerLayer(uint32_t level) const;
};

enum class LoadStage {
    Downloading,
    Building,
};

const char* toString(LoadStage stage);

// (stage, completed, total)
using ProgressCallback = std::function<void(LoadStage, uint32_t, uint32_t)>;

} // namespace rivvon
