#include <rivvon/tile-decoder.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <bit>
#include <cstring>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace rivvon {

static uint32_t readU32(std::span<const uint8_t> b, size_t off) {
    return static_cast<uint32_t>(b[off]) |
           (static_cast<uint32_t>(b[off + 1]) << 8) |
           (static_cast<uint32_t>(b[off + 2]) << 16) |
           (static_cast<uint32_t>(b[off + 3]) << 24);
}

static uint64_t readU64(std::span<const uint8_t> b, size_t off) {
    return static_cast<uint64_t>(readU32(b, off)) |
           (static_cast<uint64_t>(readU32(b, off + 4)) << 32);
}

bool TileDecoder::isKtx2(std::span<const uint8_t> bytes) {
    return bytes.size() >= sizeof(KTX2_IDENTIFIER) &&
           std::memcmp(bytes.data(), KTX2_IDENTIFIER, sizeof(KTX2_IDENTIFIER)) == 0;
}

Result<DecodedTile> TileDecoder::decode(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return Err<DecodedTile>(ErrorKind::Resource, "TileDecoder: empty tile data");
    }
    if (isKtx2(bytes)) {
        return decodeKtx2(bytes);
    }
    return decodeImage(bytes);
}

Result<TileFormat> TileDecoder::mapVkFormat(uint32_t vkFormat) {
    switch (vkFormat) {
        case 37:  return Ok(TileFormat::RGBA8Unorm);
        case 43:  return Ok(TileFormat::RGBA8UnormSrgb);
        case 133: return Ok(TileFormat::BC1RGBAUnorm);
        case 134: return Ok(TileFormat::BC1RGBAUnormSrgb);
        case 137: return Ok(TileFormat::BC3RGBAUnorm);
        case 138: return Ok(TileFormat::BC3RGBAUnormSrgb);
        case 145: return Ok(TileFormat::BC7RGBAUnorm);
        case 146: return Ok(TileFormat::BC7RGBAUnormSrgb);
        case 151: return Ok(TileFormat::ETC2RGBA8Unorm);
        case 152: return Ok(TileFormat::ETC2RGBA8UnormSrgb);
        case 157: return Ok(TileFormat::ASTC4x4Unorm);
        case 158: return Ok(TileFormat::ASTC4x4UnormSrgb);
        default:
            break;
    }
    if (vkFormat == 0) {
        return Err<TileFormat>(ErrorKind::Resource,
                               "KTX2 vkFormat undefined (Basis Universal payloads are not supported)");
    }
    return Err<TileFormat>(ErrorKind::Resource,
                           "unsupported KTX2 vkFormat " + std::to_string(vkFormat));
}

// =============================================================================
// KTX2
// =============================================================================

Result<DecodedTile> TileDecoder::decodeKtx2(std::span<const uint8_t> bytes) {
    if (!isKtx2(bytes)) {
        return Err<DecodedTile>(ErrorKind::Resource, "KTX2: bad identifier");
    }
    if (bytes.size() < KTX2_HEADER_SIZE) {
        return Err<DecodedTile>(ErrorKind::Resource, "KTX2: truncated header");
    }

    uint32_t vkFormat = readU32(bytes, 12);
    uint32_t pixelWidth = readU32(bytes, 20);
    uint32_t pixelHeight = readU32(bytes, 24);
    uint32_t pixelDepth = readU32(bytes, 28);
    uint32_t layerCount = readU32(bytes, 32);
    uint32_t faceCount = readU32(bytes, 36);
    uint32_t levelCount = readU32(bytes, 40);
    uint32_t supercompression = readU32(bytes, 44);

    if (supercompression != 0) {
        return Err<DecodedTile>(ErrorKind::Resource,
                                "KTX2: supercompression scheme " + std::to_string(supercompression) +
                                " not supported");
    }
    if (pixelWidth == 0 || pixelHeight == 0) {
        return Err<DecodedTile>(ErrorKind::Resource, "KTX2: zero-sized image");
    }
    if (pixelDepth > 1 || faceCount > 1) {
        return Err<DecodedTile>(ErrorKind::Resource, "KTX2: 3D and cubemap textures are not tiles");
    }

    auto format = mapVkFormat(vkFormat);
    if (!format) {
        return Err<DecodedTile>("KTX2: format", format);
    }

    DecodedTile tile;
    tile.format = *format;
    tile.width = pixelWidth;
    tile.height = pixelHeight;
    tile.layers = std::max(1u, layerCount);
    uint32_t levels = std::max(1u, levelCount);

    // full mip chain ends at 1x1
    const uint32_t maxLevels = static_cast<uint32_t>(std::bit_width(std::max(pixelWidth, pixelHeight)));
    if (levels > maxLevels) {
        return Err<DecodedTile>(ErrorKind::Resource,
                                "KTX2: " + std::to_string(levels) + " levels exceed the " +
                                std::to_string(maxLevels) + " of a " + std::to_string(pixelWidth) + "x" +
                                std::to_string(pixelHeight) + " image");
    }

    uint64_t indexEnd = KTX2_HEADER_SIZE + static_cast<uint64_t>(levels) * KTX2_LEVEL_ENTRY_SIZE;
    if (indexEnd > bytes.size()) {
        return Err<DecodedTile>(ErrorKind::Resource, "KTX2: truncated level index");
    }

    tile.levels.resize(levels);
    for (uint32_t level = 0; level < levels; ++level) {
        size_t entry = KTX2_HEADER_SIZE + level * KTX2_LEVEL_ENTRY_SIZE;
        uint64_t byteOffset = readU64(bytes, entry);
        uint64_t byteLength = readU64(bytes, entry + 8);

        if (byteOffset > bytes.size() || byteLength > bytes.size() - byteOffset) {
            return Err<DecodedTile>(ErrorKind::Resource,
                                    "KTX2: level " + std::to_string(level) + " out of bounds");
        }
        uint64_t expected = tile.bytesPerLayer(level) * tile.layers;
        if (byteLength < expected) {
            return Err<DecodedTile>(ErrorKind::Resource,
                                    "KTX2: level " + std::to_string(level) + " has " +
                                    std::to_string(byteLength) + " bytes, expected " +
                                    std::to_string(expected));
        }

        auto& out = tile.levels[level];
        out.width = std::max(1u, pixelWidth >> level);
        out.height = std::max(1u, pixelHeight >> level);
        auto first = bytes.begin() + static_cast<std::ptrdiff_t>(byteOffset);
        out.data.assign(first, first + static_cast<std::ptrdiff_t>(expected));
    }

    ydebug("TileDecoder: KTX2 {}x{} layers={} levels={} format={}",
           tile.width, tile.height, tile.layers, levels, toString(tile.format));
    return Ok(std::move(tile));
}

// =============================================================================
// PNG / JPEG
// =============================================================================

Result<DecodedTile> TileDecoder::decodeImage(std::span<const uint8_t> bytes) {
    int w = 0, h = 0, channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                            &w, &h, &channels, 4);
    if (!pixels) {
        return Err<DecodedTile>(ErrorKind::Resource,
                                std::string("image decode failed: ") + stbi_failure_reason());
    }

    DecodedTile tile;
    tile.format = TileFormat::RGBA8Unorm;
    tile.width = static_cast<uint32_t>(w);
    tile.height = static_cast<uint32_t>(h);
    tile.layers = 1;
    tile.levels.resize(1);
    tile.levels[0].width = tile.width;
    tile.levels[0].height = tile.height;
    tile.levels[0].data.assign(pixels, pixels + static_cast<size_t>(w) * h * 4);
    stbi_image_free(pixels);

    ydebug("TileDecoder: image {}x{} ({} channels)", w, h, channels);
    return Ok(std::move(tile));
}

} // namespace rivvon
