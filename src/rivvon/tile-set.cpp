#include <rivvon/tile-set.h>
#include <algorithm>
#include <cctype>

namespace rivvon {

const char* toString(CycleMode mode) {
    return mode == CycleMode::Planes ? "planes" : "waves";
}

Result<CycleMode> parseCycleMode(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "waves" || lower == "wave") return Ok(CycleMode::Waves);
    if (lower == "planes" || lower == "plane") return Ok(CycleMode::Planes);
    return Err<CycleMode>("unknown cross-section type '" + name + "'");
}

const char* toString(TileFormat format) {
    switch (format) {
        case TileFormat::RGBA8Unorm:         return "rgba8unorm";
        case TileFormat::RGBA8UnormSrgb:     return "rgba8unorm-srgb";
        case TileFormat::BC1RGBAUnorm:       return "bc1-rgba-unorm";
        case TileFormat::BC1RGBAUnormSrgb:   return "bc1-rgba-unorm-srgb";
        case TileFormat::BC3RGBAUnorm:       return "bc3-rgba-unorm";
        case TileFormat::BC3RGBAUnormSrgb:   return "bc3-rgba-unorm-srgb";
        case TileFormat::BC7RGBAUnorm:       return "bc7-rgba-unorm";
        case TileFormat::BC7RGBAUnormSrgb:   return "bc7-rgba-unorm-srgb";
        case TileFormat::ETC2RGBA8Unorm:     return "etc2-rgba8unorm";
        case TileFormat::ETC2RGBA8UnormSrgb: return "etc2-rgba8unorm-srgb";
        case TileFormat::ASTC4x4Unorm:       return "astc-4x4-unorm";
        case TileFormat::ASTC4x4UnormSrgb:   return "astc-4x4-unorm-srgb";
    }
    return "unknown";
}

TileFormatInfo formatInfo(TileFormat format) {
    switch (format) {
        case TileFormat::RGBA8Unorm:
        case TileFormat::RGBA8UnormSrgb:
            return {1, 1, 4};
        case TileFormat::BC1RGBAUnorm:
        case TileFormat::BC1RGBAUnormSrgb:
            return {4, 4, 8};
        case TileFormat::BC3RGBAUnorm:
        case TileFormat::BC3RGBAUnormSrgb:
        case TileFormat::BC7RGBAUnorm:
        case TileFormat::BC7RGBAUnormSrgb:
        case TileFormat::ETC2RGBA8Unorm:
        case TileFormat::ETC2RGBA8UnormSrgb:
        case TileFormat::ASTC4x4Unorm:
        case TileFormat::ASTC4x4UnormSrgb:
            return {4, 4, 16};
    }
    return {1, 1, 4};
}

uint32_t DecodedTile::bytesPerRow(uint32_t level) const {
    auto info = formatInfo(format);
    uint32_t w = level < 32 ? std::max(1u, width >> level) : 1u;
    uint32_t blocksWide = (w + info.blockWidth - 1) / info.blockWidth;
    return blocksWide * info.bytesPerBlock;
}

uint32_t DecodedTile::rowsPerImage(uint32_t level) const {
    auto info = formatInfo(format);
    uint32_t h = level < 32 ? std::max(1u, height >> level) : 1u;
    return (h + info.blockHeight - 1) / info.blockHeight;
}

uint64_t DecodedTile::bytesPerLayer(uint32_t level) const {
    return static_cast<uint64_t>(bytesPerRow(level)) * rowsPerImage(level);
}

const char* toString(LoadStage stage) {
    return stage == LoadStage::Downloading ? "downloading" : "building";
}

} // namespace rivvon
