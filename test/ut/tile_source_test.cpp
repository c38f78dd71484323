//=============================================================================
// TileSource Unit Tests
//
// Covers: texture set descriptor parsing, memory and directory sources,
// TileSetData loading with progress, "tiles unavailable" failures
//=============================================================================

// Include C++ standard headers before boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "rivvon/tile-source.h"
#include "harness/mock_gpu.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace boost::ut;
using namespace rivvon;
using namespace rivvon::test;

namespace {

std::filesystem::path makeTempDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("rivvon-ut-" + std::to_string(getpid()) + "-" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void writeBytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

} // namespace

suite tile_source_tests = [] {
    //=========================================================================
    // Descriptor
    //=========================================================================

    "parseDescriptor reads the remote texture set document"_test = [] {
        const std::string json = R"({
            "id": "aurora",
            "name": "Aurora",
            "tile_count": 3,
            "layer_count": 24,
            "thumbnail_url": "https://cdn.example/aurora.jpg",
            "cross_section_type": "planes",
            "tiles": [
                {"tile_index": 2, "r2_key": "aurora/2.ktx2", "file_size": 300},
                {"tile_index": 0, "public_url": "https://cdn.example/aurora/0.ktx2"},
                {"tile_index": 1, "r2_key": "aurora/1.ktx2"}
            ]
        })";

        auto info = TileSource::parseDescriptor(json, "https://cdn.test");
        expect(info.has_value()) << error_msg(info);
        if (!info) return;

        expect(info->id == "aurora");
        expect(info->name == "Aurora");
        expect(info->tileCount == 3_u);
        expect(info->layerCount == 24_u);
        expect(info->mode == CycleMode::Planes);
        expect(info->thumbnailUrl == "https://cdn.example/aurora.jpg");
        expect(info->tiles.size() == 3_u);
        expect(info->tiles[0].index == 0_u) << "Sorted by tile index";
        expect(info->tiles[0].url == "https://cdn.example/aurora/0.ktx2");
        expect(info->tiles[1].url == "https://cdn.test/aurora/1.ktx2") << "r2_key joined to the CDN base";
        expect(info->tiles[2].fileSize == 300_u);
    };

    "parseDescriptor accepts camelCase metadata"_test = [] {
        const std::string yaml =
            "name: local\n"
            "tileCount: 2\n"
            "settings:\n"
            "  crossSectionType: waves\n";
        auto info = TileSource::parseDescriptor(yaml);
        expect(info.has_value()) << error_msg(info);
        if (!info) return;
        expect(info->tileCount == 2_u);
        expect(info->mode == CycleMode::Waves);
    };

    "parseDescriptor counts tiles when tile_count is missing"_test = [] {
        auto info = TileSource::parseDescriptor(R"({"tiles": [{"url": "a"}, {"url": "b"}]})");
        expect(info.has_value()) << error_msg(info);
        if (!info) return;
        expect(info->tileCount == 2_u);
        expect(info->tiles[1].index == 1_u);
    };

    "parseDescriptor reports service errors and bad documents"_test = [] {
        auto service = TileSource::parseDescriptor(R"({"error": "not found"})");
        expect(!service);
        expect(error_kind(service) == ErrorKind::Resource);

        auto notMap = TileSource::parseDescriptor("[1, 2, 3]");
        expect(!notMap);

        auto broken = TileSource::parseDescriptor("{ unterminated");
        expect(!broken);
        expect(error_kind(broken) == ErrorKind::Resource);
    };

    "parseCycleMode is case insensitive"_test = [] {
        expect(*parseCycleMode("Planes") == CycleMode::Planes);
        expect(*parseCycleMode("WAVES") == CycleMode::Waves);
        expect(!parseCycleMode("spiral"));
    };

    //=========================================================================
    // Memory source + TileSetData
    //=========================================================================

    "load reports downloading then building progress"_test = [] {
        auto source = makeKtx2Source(3, 5);
        std::vector<std::pair<LoadStage, uint32_t>> events;

        auto data = TileSetData::load(*source, [&](LoadStage stage, uint32_t done, uint32_t total) {
            expect(total == 3_u);
            events.emplace_back(stage, done);
        });
        expect(data.has_value()) << error_msg(data);
        if (!data) return;

        expect(data->tiles.size() == 3_u);
        expect(data->layerCount() == 5_u) << "Layer count from the first tile";
        expect(events.size() == 8_u);
        expect(events.front().first == LoadStage::Downloading);
        expect(events[3].first == LoadStage::Downloading && events[3].second == 3u);
        expect(events[4].first == LoadStage::Building && events[4].second == 0u);
        expect(events.back().first == LoadStage::Building && events.back().second == 3u);
    };

    "load fails with tiles unavailable on a missing tile"_test = [] {
        TileSetInfo info;
        info.name = "short";
        info.tileCount = 3;
        auto source = TileSource::createMemory(info, {makeKtx2(4, 4, 1), makeKtx2(4, 4, 1)});

        auto data = TileSetData::load(*source);
        expect(!data);
        expect(error_kind(data) == ErrorKind::Resource);
        expect(error_msg(data).find("tiles unavailable") != std::string::npos);
    };

    "load fails with tiles unavailable on a corrupt tile"_test = [] {
        TileSetInfo info;
        info.name = "corrupt";
        auto source = TileSource::createMemory(info, {makeKtx2(4, 4, 1), std::vector<uint8_t>(32, 0x42)});

        auto data = TileSetData::load(*source);
        expect(!data);
        expect(error_kind(data) == ErrorKind::Resource);
        expect(error_msg(data).find("tile 1 is corrupt") != std::string::npos);
    };

    "memory source label and describe"_test = [] {
        TileSetInfo info;
        info.name = "bundled";
        auto source = TileSource::createMemory(info, {makeKtx2(4, 4, 1)});
        expect(source->label() == "memory:bundled");
        auto described = source->describe();
        expect(described.has_value());
        expect(described->tileCount == 1_u) << "Tile count from the tile list";
    };

    //=========================================================================
    // Directory source
    //=========================================================================

    "directory source finds contiguous numbered tiles"_test = [] {
        auto dir = makeTempDir("tiles-ktx2-planes");
        writeBytes(dir / "0.ktx2", makeKtx2(4, 4, 4));
        writeBytes(dir / "1.ktx2", makeKtx2(4, 4, 4));
        writeBytes(dir / "3.ktx2", makeKtx2(4, 4, 4));  // gap: not part of the set

        auto source = TileSource::createDirectory(dir);
        expect(source.has_value()) << error_msg(source);
        if (!source) return;

        auto info = (*source)->describe();
        expect(info.has_value()) << error_msg(info);
        if (!info) return;
        expect(info->tileCount == 2_u);
        expect(info->mode == CycleMode::Planes) << "Mode from the folder name";

        auto data = TileSetData::load(**source);
        expect(data.has_value()) << error_msg(data);
        if (data) {
            expect(data->layerCount() == 4_u);
        }
        std::filesystem::remove_all(dir);
    };

    "directory source prefers metadata"_test = [] {
        auto dir = makeTempDir("with-metadata");
        writeBytes(dir / "0.ktx2", makeKtx2(4, 4, 2));
        std::ofstream(dir / "metadata.json") << R"({"name": "Meta", "crossSectionType": "planes"})";

        auto source = TileSource::createDirectory(dir);
        expect(source.has_value()) << error_msg(source);
        if (!source) return;
        auto info = (*source)->describe();
        expect(info.has_value()) << error_msg(info);
        if (!info) return;
        expect(info->name == "Meta");
        expect(info->mode == CycleMode::Planes);
        expect(info->tileCount == 1_u);
        std::filesystem::remove_all(dir);
    };

    "directory source errors"_test = [] {
        auto missing = TileSource::createDirectory("/nonexistent/rivvon/tiles");
        expect(!missing);
        expect(error_kind(missing) == ErrorKind::Resource);

        auto dir = makeTempDir("empty");
        auto source = TileSource::createDirectory(dir);
        expect(source.has_value());
        if (source) {
            auto info = (*source)->describe();
            expect(!info) << "No tiles";
        }
        std::filesystem::remove_all(dir);
    };
};
