//=============================================================================
// TileDecoder Unit Tests
//
// Covers: KTX2 header parsing, layered payloads, rejected containers,
// PNG fallback decoding, block-compressed sizing
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "rivvon/tile-decoder.h"
#include "rivvon/frame-encoding.h"
#include "harness/mock_gpu.h"

using namespace boost::ut;
using namespace rivvon;
using namespace rivvon::test;

suite tile_decoder_tests = [] {
    //=========================================================================
    // KTX2
    //=========================================================================

    "isKtx2 checks the identifier"_test = [] {
        auto ktx = makeKtx2(4, 4, 2);
        expect(TileDecoder::isKtx2(ktx));

        std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0, 0};
        expect(!TileDecoder::isKtx2(png));
        expect(!TileDecoder::isKtx2(std::vector<uint8_t>(5, 0xAB)));
    };

    "KTX2 keeps every layer"_test = [] {
        auto bytes = makeKtx2(8, 4, 6);
        auto tile = TileDecoder::decode(bytes);
        expect(tile.has_value()) << error_msg(tile);
        if (!tile) return;

        expect(tile->format == TileFormat::RGBA8Unorm);
        expect(tile->width == 8_u);
        expect(tile->height == 4_u);
        expect(tile->layers == 6_u);
        expect(tile->levels.size() == 1_u);
        expect(tile->levels[0].data.size() == 384u) << "8 x 4 RGBA x 6 layers";

        // layer k is filled with k
        const size_t perLayer = 8 * 4 * 4;
        expect(tile->levels[0].data[0] == 0_u);
        expect(tile->levels[0].data[perLayer * 3] == 3_u);
        expect(tile->levels[0].data[perLayer * 5 + 7] == 5_u);
    };

    "KTX2 with layerCount 0 is a single layer"_test = [] {
        auto tile = TileDecoder::decode(makeKtx2(4, 4, 0));
        expect(tile.has_value()) << error_msg(tile);
        if (!tile) return;
        expect(tile->layers == 1_u);
    };

    "KTX2 srgb format maps"_test = [] {
        auto tile = TileDecoder::decode(makeKtx2(4, 4, 1, 43));
        expect(tile.has_value()) << error_msg(tile);
        if (!tile) return;
        expect(tile->format == TileFormat::RGBA8UnormSrgb);
    };

    "KTX2 supercompression is rejected"_test = [] {
        auto res = TileDecoder::decode(makeKtx2(4, 4, 1, 37, 2));
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);
    };

    "KTX2 Basis payload (vkFormat 0) is rejected"_test = [] {
        auto res = TileDecoder::decode(makeKtx2(4, 4, 1, 0));
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);
    };

    "KTX2 truncated header is rejected"_test = [] {
        auto bytes = makeKtx2(4, 4, 1);
        bytes.resize(40);
        auto res = TileDecoder::decode(bytes);
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);
    };

    "KTX2 level past the end is rejected"_test = [] {
        auto bytes = makeKtx2(4, 4, 3);
        bytes.resize(bytes.size() - 10);
        auto res = TileDecoder::decode(bytes);
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);
    };

    "KTX2 level offset that wraps around is rejected"_test = [] {
        auto bytes = makeKtx2(1, 1, 1);
        putU64(bytes, KTX2_HEADER_SIZE, 0xFFFFFFFFFFFFFFF0ull);
        putU64(bytes, KTX2_HEADER_SIZE + 8, 0x20);
        auto res = TileDecoder::decode(bytes);
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);
        expect(error_msg(res).find("out of bounds") != std::string::npos);
    };

    "KTX2 level starting inside but running past the file is rejected"_test = [] {
        auto bytes = makeKtx2(1, 1, 1);
        putU64(bytes, KTX2_HEADER_SIZE, bytes.size() - 2);
        putU64(bytes, KTX2_HEADER_SIZE + 8, 4);
        auto res = TileDecoder::decode(bytes);
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);

        putU64(bytes, KTX2_HEADER_SIZE, bytes.size() + 100);
        putU64(bytes, KTX2_HEADER_SIZE + 8, 0);
        auto past = TileDecoder::decode(bytes);
        expect(!past);
        expect(error_kind(past) == ErrorKind::Resource);
    };

    "KTX2 level count above the mip chain is rejected"_test = [] {
        auto bytes = makeKtx2(4, 4, 1);
        putU32(bytes, 40, 4);  // 4x4 has 3 levels: 4, 2, 1
        auto res = TileDecoder::decode(bytes);
        expect(!res);
        expect(error_kind(res) == ErrorKind::Resource);
        expect(error_msg(res).find("levels exceed") != std::string::npos);

        // a level index large enough for 40 entries still fails on the mip limit
        auto big = makeKtx2(4, 4, 1);
        big.resize(KTX2_HEADER_SIZE + 40 * KTX2_LEVEL_ENTRY_SIZE + 64, 0);
        putU32(big, 40, 40);
        auto deep = TileDecoder::decode(big);
        expect(!deep);
        expect(error_kind(deep) == ErrorKind::Resource);
        expect(error_msg(deep).find("levels exceed") != std::string::npos);
    };

    "deep level sizes clamp to one pixel"_test = [] {
        DecodedTile tile;
        tile.width = 8;
        tile.height = 8;
        expect(tile.bytesPerRow(40) == 4_u);
        expect(tile.rowsPerImage(32) == 1_u);
    };

    "mapVkFormat covers compressed families"_test = [] {
        expect(*TileDecoder::mapVkFormat(133) == TileFormat::BC1RGBAUnorm);
        expect(*TileDecoder::mapVkFormat(145) == TileFormat::BC7RGBAUnorm);
        expect(*TileDecoder::mapVkFormat(152) == TileFormat::ETC2RGBA8UnormSrgb);
        expect(*TileDecoder::mapVkFormat(157) == TileFormat::ASTC4x4Unorm);
        expect(!TileDecoder::mapVkFormat(999));
    };

    "block compressed sizes round up to whole blocks"_test = [] {
        DecodedTile tile;
        tile.format = TileFormat::BC1RGBAUnorm;
        tile.width = 10;
        tile.height = 6;
        expect(tile.bytesPerRow(0) == 24_u) << "3 blocks x 8 bytes";
        expect(tile.rowsPerImage(0) == 2_u);
        expect(tile.bytesPerLayer(0) == 48_u);
        expect(tile.bytesPerRow(3) == 8_u) << "1x1 level still one block";
    };

    //=========================================================================
    // PNG / JPEG
    //=========================================================================

    "PNG decodes to one RGBA8 layer"_test = [] {
        std::vector<uint8_t> rgba(3 * 2 * 4);
        for (size_t i = 0; i < rgba.size(); ++i) {
            rgba[i] = static_cast<uint8_t>(i * 7);
        }
        auto png = encodePng(rgba, 3, 2);
        expect(png.has_value()) << error_msg(png);
        if (!png) return;

        auto tile = TileDecoder::decode(*png);
        expect(tile.has_value()) << error_msg(tile);
        if (!tile) return;
        expect(tile->format == TileFormat::RGBA8Unorm);
        expect(tile->width == 3_u);
        expect(tile->height == 2_u);
        expect(tile->layers == 1_u);
        expect(tile->levels[0].data == rgba) << "Lossless";
    };

    "garbage and empty input fail"_test = [] {
        auto empty = TileDecoder::decode(std::vector<uint8_t>{});
        expect(!empty);
        expect(error_kind(empty) == ErrorKind::Resource);

        auto garbage = TileDecoder::decode(std::vector<uint8_t>(64, 0x42));
        expect(!garbage);
        expect(error_kind(garbage) == ErrorKind::Resource);
    };
};
