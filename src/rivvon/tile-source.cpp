#include <rivvon/tile-source.h>
#include <rivvon/tile-decoder.h>
#include <ytrace/ytrace.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>

namespace rivvon {

// =============================================================================
// Descriptor parsing
// =============================================================================

// First present scalar among alternative key spellings
static YAML::Node pick(const YAML::Node& node, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (node[key] && !node[key].IsNull()) {
            return node[key];
        }
    }
    return YAML::Node();
}

Result<TileSetInfo> TileSource::parseDescriptor(const std::string& text, const std::string& cdnBase) {
    YAML::Node doc;
    try {
        doc = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Err<TileSetInfo>(ErrorKind::Resource,
                                "texture set descriptor parse error: " + std::string(e.what()));
    }
    if (!doc || !doc.IsMap()) {
        return Err<TileSetInfo>(ErrorKind::Resource, "texture set descriptor is not an object");
    }
    if (auto error = doc["error"]; error && error.IsScalar()) {
        return Err<TileSetInfo>(ErrorKind::Resource, "texture set service: " + error.as<std::string>());
    }

    TileSetInfo info;
    try {
        if (auto n = pick(doc, {"id"})) info.id = n.as<std::string>();
        if (auto n = pick(doc, {"name"})) info.name = n.as<std::string>();
        if (auto n = pick(doc, {"tile_count", "tileCount"})) info.tileCount = n.as<uint32_t>();
        if (auto n = pick(doc, {"layer_count", "layerCount"})) info.layerCount = n.as<uint32_t>();
        if (auto n = pick(doc, {"thumbnail_url", "thumbnailUrl"})) info.thumbnailUrl = n.as<std::string>();

        YAML::Node mode = pick(doc, {"cross_section_type", "crossSectionType"});
        if (!mode && doc["settings"]) {
            mode = pick(doc["settings"], {"crossSectionType", "cross_section_type"});
        }
        if (mode) {
            auto parsed = parseCycleMode(mode.as<std::string>());
            if (!parsed) {
                ywarn("TileSource: {}, using waves", error_msg(parsed));
            } else {
                info.mode = *parsed;
            }
        }

        if (auto tiles = doc["tiles"]; tiles && tiles.IsSequence()) {
            for (const auto& t : tiles) {
                TileEntry entry;
                if (auto n = pick(t, {"tileIndex", "tile_index", "index"})) {
                    entry.index = n.as<uint32_t>();
                } else {
                    entry.index = static_cast<uint32_t>(info.tiles.size());
                }
                if (auto n = pick(t, {"url", "public_url"})) {
                    entry.url = n.as<std::string>();
                }
                if (entry.url.empty()) {
                    if (auto n = pick(t, {"r2_key"})) {
                        entry.url = cdnBase + "/" + n.as<std::string>();
                    }
                }
                if (auto n = pick(t, {"fileSize", "file_size"})) {
                    entry.fileSize = n.as<uint64_t>();
                }
                info.tiles.push_back(std::move(entry));
            }
            std::sort(info.tiles.begin(), info.tiles.end(),
                      [](const TileEntry& a, const TileEntry& b) { return a.index < b.index; });
        }
    } catch (const YAML::Exception& e) {
        return Err<TileSetInfo>(ErrorKind::Resource,
                                "texture set descriptor has bad field: " + std::string(e.what()));
    }

    if (info.tileCount == 0) {
        info.tileCount = static_cast<uint32_t>(info.tiles.size());
    }
    return Ok(std::move(info));
}

// =============================================================================
// MemoryTileSource
// =============================================================================

class MemoryTileSource : public TileSource {
public:
    MemoryTileSource(TileSetInfo info, std::vector<std::vector<uint8_t>> tiles)
        : _info(std::move(info)), _tiles(std::move(tiles)) {
        if (_info.tileCount == 0) {
            _info.tileCount = static_cast<uint32_t>(_tiles.size());
        }
    }

    Result<TileSetInfo> describe() override { return Ok(_info); }

    Result<std::vector<uint8_t>> fetchTile(const TileSetInfo&, uint32_t index) override {
        if (index >= _tiles.size()) {
            return Err<std::vector<uint8_t>>(ErrorKind::Resource,
                                             "memory tile " + std::to_string(index) + " missing");
        }
        return Ok(_tiles[index]);
    }

    std::string label() const override { return "memory:" + _info.name; }

private:
    TileSetInfo _info;
    std::vector<std::vector<uint8_t>> _tiles;
};

TileSource::Ptr TileSource::createMemory(TileSetInfo info, std::vector<std::vector<uint8_t>> tiles) noexcept {
    return std::make_shared<MemoryTileSource>(std::move(info), std::move(tiles));
}

// =============================================================================
// DirectoryTileSource
// =============================================================================

static constexpr const char* TILE_EXTENSIONS[] = {".ktx2", ".png", ".jpg", ".jpeg"};

class DirectoryTileSource : public TileSource {
public:
    explicit DirectoryTileSource(std::filesystem::path dir) : _dir(std::move(dir)) {}

    Result<void> init() {
        std::error_code ec;
        if (!std::filesystem::is_directory(_dir, ec)) {
            return Err(ErrorKind::Resource, "tile directory not found: " + _dir.string());
        }
        return Ok();
    }

    Result<TileSetInfo> describe() override {
        TileSetInfo info;
        bool haveMetadata = false;

        for (const char* name : {"metadata.json", "metadata.yaml", "metadata.yml"}) {
            auto path = _dir / name;
            if (!std::filesystem::exists(path)) continue;

            std::ifstream file(path);
            if (!file.is_open()) {
                return Err<TileSetInfo>(ErrorKind::Resource, "cannot open " + path.string());
            }
            std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            auto parsed = parseDescriptor(text);
            if (!parsed) {
                return Err<TileSetInfo>("tile directory metadata " + path.string(), parsed);
            }
            info = std::move(*parsed);
            haveMetadata = true;
            break;
        }

        if (!haveMetadata) {
            // waves unless the folder says otherwise (tiles-ktx2-planes)
            info.mode = _dir.filename().string().find("planes") != std::string::npos
                            ? CycleMode::Planes
                            : CycleMode::Waves;
            yinfo("TileSource: no metadata in {}, assuming {}", _dir.string(), toString(info.mode));
        }
        if (info.name.empty()) {
            info.name = _dir.filename().string();
        }
        if (info.id.empty()) {
            info.id = info.name;
        }

        // contiguous N.<ext> files from 0
        uint32_t found = 0;
        while (tilePath(found)) {
            ++found;
        }
        if (info.tileCount == 0 || info.tileCount > found) {
            if (info.tileCount > found) {
                ywarn("TileSource: metadata lists {} tiles but {} has {}", info.tileCount, _dir.string(), found);
            }
            info.tileCount = found;
        }
        if (info.tileCount == 0) {
            return Err<TileSetInfo>(ErrorKind::Resource, "no tiles in " + _dir.string());
        }

        info.tiles.clear();
        for (uint32_t i = 0; i < info.tileCount; ++i) {
            TileEntry entry;
            entry.index = i;
            entry.url = tilePath(i)->string();
            std::error_code ec;
            entry.fileSize = std::filesystem::file_size(*tilePath(i), ec);
            info.tiles.push_back(std::move(entry));
        }
        return Ok(std::move(info));
    }

    Result<std::vector<uint8_t>> fetchTile(const TileSetInfo&, uint32_t index) override {
        auto path = tilePath(index);
        if (!path) {
            return Err<std::vector<uint8_t>>(ErrorKind::Resource,
                                             "tile " + std::to_string(index) + " missing in " + _dir.string());
        }
        std::ifstream file(*path, std::ios::binary);
        if (!file.is_open()) {
            return Err<std::vector<uint8_t>>(ErrorKind::Resource, "cannot open " + path->string());
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return Ok(std::move(bytes));
    }

    std::string label() const override { return _dir.string(); }

private:
    std::optional<std::filesystem::path> tilePath(uint32_t index) const {
        for (const char* ext : TILE_EXTENSIONS) {
            auto path = _dir / (std::to_string(index) + ext);
            if (std::filesystem::exists(path)) {
                return path;
            }
        }
        return std::nullopt;
    }

    std::filesystem::path _dir;
};

Result<TileSource::Ptr> TileSource::createDirectory(const std::filesystem::path& dir) noexcept {
    auto source = std::make_shared<DirectoryTileSource>(dir);
    if (auto res = source->init(); !res) {
        return Err<Ptr>("Failed to open tile directory", res);
    }
    return Ok(std::move(source));
}

// =============================================================================
// TileSetData
// =============================================================================

Result<TileSetData> TileSetData::load(TileSource& source, const ProgressCallback& onProgress) {
    auto described = source.describe();
    if (!described) {
        return Err<TileSetData>(ErrorKind::Resource, "tiles unavailable from " + source.label(), described);
    }

    TileSetData data;
    data.info = std::move(*described);
    const uint32_t count = data.info.tileCount;
    if (count == 0) {
        return Err<TileSetData>(ErrorKind::Resource, "tiles unavailable: " + source.label() + " has no tiles");
    }

    yinfo("TileSetData: loading {} tiles from {}", count, source.label());

    std::vector<std::vector<uint8_t>> encoded;
    encoded.reserve(count);
    if (onProgress) onProgress(LoadStage::Downloading, 0, count);
    for (uint32_t i = 0; i < count; ++i) {
        auto bytes = source.fetchTile(data.info, i);
        if (!bytes) {
            return Err<TileSetData>(ErrorKind::Resource,
                                    "tiles unavailable: tile " + std::to_string(i) + " fetch failed", bytes);
        }
        encoded.push_back(std::move(*bytes));
        if (onProgress) onProgress(LoadStage::Downloading, i + 1, count);
    }

    data.tiles.reserve(count);
    if (onProgress) onProgress(LoadStage::Building, 0, count);
    for (uint32_t i = 0; i < count; ++i) {
        auto tile = TileDecoder::decode(encoded[i]);
        if (!tile) {
            return Err<TileSetData>(ErrorKind::Resource,
                                    "tiles unavailable: tile " + std::to_string(i) + " is corrupt", tile);
        }
        encoded[i].clear();
        encoded[i].shrink_to_fit();

        // set layer count comes from the first tile
        if (i == 0) {
            if (data.info.layerCount != 0 && data.info.layerCount != tile->layers) {
                ywarn("TileSetData: descriptor says {} layers, tile 0 has {}", data.info.layerCount, tile->layers);
            }
            data.info.layerCount = tile->layers;
        } else if (tile->layers != data.info.layerCount) {
            ywarn("TileSetData: tile {} has {} layers, set has {}", i, tile->layers, data.info.layerCount);
        }

        data.tiles.push_back(std::move(*tile));
        if (onProgress) onProgress(LoadStage::Building, i + 1, count);
    }

    yinfo("TileSetData: {} tiles decoded, {} layers, mode={}",
          count, data.info.layerCount, toString(data.info.mode));
    return Ok(std::move(data));
}

} // namespace rivvon
