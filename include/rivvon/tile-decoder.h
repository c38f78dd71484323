#pragma once

#include <rivvon/result.hpp>
#include <rivvon/tile-set.h>
#include <cstdint>
#include <span>

namespace rivvon {

// KTX2 identifier: «KTX 20»\r\n\x1A\n
constexpr uint8_t KTX2_IDENTIFIER[12] = {
    0xAB, 0x4B, 0x54, 0x58, 0x20, 0x32, 0x30, 0xBB, 0x0D, 0x0A, 0x1A, 0x0A};

constexpr uint32_t KTX2_HEADER_SIZE = 80;      // identifier + header fields
constexpr uint32_t KTX2_LEVEL_ENTRY_SIZE = 24; // byteOffset, byteLength, uncompressedByteLength

/**
 * Decodes one encoded tile into layered pixel data ready for upload.
 *
 * KTX2 containers keep their layers (one per animation frame) and mip levels.
 * Only supercompression scheme 0 (none) is accepted; Basis/zstd payloads are
 * reported as unsupported. PNG and JPEG decode to a single RGBA8 layer.
 */
class TileDecoder {
public:
    static bool isKtx2(std::span<const uint8_t> bytes);

    static Result<DecodedTile> decode(std::span<const uint8_t> bytes);
    static Result<DecodedTile> decodeKtx2(std::span<const uint8_t> bytes);
    static Result<DecodedTile> decodeImage(std::span<const uint8_t> bytes);

    // Vulkan format id -> TileFormat
    static Result<TileFormat> mapVkFormat(uint32_t vkFormat);
};

} // namespace rivvon
