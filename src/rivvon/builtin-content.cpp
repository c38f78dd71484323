#include <rivvon/builtin-content.h>
#include <rivvon/frame-encoding.h>
#include <ytrace/ytrace.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace rivvon {

PathSet builtinSpiral(uint32_t turns, uint32_t pointsPerTurn) {
    PointSequence spiral;
    const uint32_t count = std::max(2u, turns * pointsPerTurn);
    spiral.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        float t = static_cast<float>(i) / static_cast<float>(count - 1);
        float angle = t * static_cast<float>(turns) * glm::two_pi<float>();
        float radius = 1.0f + 3.0f * t;
        spiral.emplace_back(radius * std::cos(angle), radius * std::sin(angle), -1.5f + 3.0f * t);
    }
    return {spiral};
}

// HSV with s = v = 1
static void hueToRgb(float hue, uint8_t* rgb) {
    float h = std::fmod(hue, 1.0f) * 6.0f;
    float x = 1.0f - std::fabs(std::fmod(h, 2.0f) - 1.0f);
    float r = 0, g = 0, b = 0;
    switch (static_cast<int>(h)) {
        case 0: r = 1; g = x; break;
        case 1: r = x; g = 1; break;
        case 2: g = 1; b = x; break;
        case 3: g = x; b = 1; break;
        case 4: r = x; b = 1; break;
        default: r = 1; b = x; break;
    }
    rgb[0] = static_cast<uint8_t>(r * 255.0f);
    rgb[1] = static_cast<uint8_t>(g * 255.0f);
    rgb[2] = static_cast<uint8_t>(b * 255.0f);
}

TileSource::Ptr builtinTileSource(uint32_t tileCount, uint32_t tileSize) {
    tileCount = std::max(1u, tileCount);
    tileSize = std::max(4u, tileSize);

    TileSetInfo info;
    info.id = "builtin";
    info.name = "Built-in stripes";
    info.tileCount = tileCount;
    info.layerCount = 1;
    info.mode = CycleMode::Waves;

    std::vector<std::vector<uint8_t>> tiles;
    tiles.reserve(tileCount);
    for (uint32_t t = 0; t < tileCount; t++) {
        std::vector<uint8_t> rgba(static_cast<size_t>(tileSize) * tileSize * 4);
        float baseHue = static_cast<float>(t) / static_cast<float>(tileCount);
        for (uint32_t y = 0; y < tileSize; y++) {
            for (uint32_t x = 0; x < tileSize; x++) {
                uint8_t* px = &rgba[(static_cast<size_t>(y) * tileSize + x) * 4];
                float stripe = static_cast<float>((x * 4) / tileSize) * 0.04f;
                hueToRgb(baseHue + stripe, px);
                // darker border marks tile boundaries
                bool edge = x == 0 || y == 0 || x == tileSize - 1 || y == tileSize - 1;
                if (edge) {
                    px[0] /= 3;
                    px[1] /= 3;
                    px[2] /= 3;
                }
                px[3] = 255;
            }
        }
        auto png = encodePng(rgba, tileSize, tileSize);
        if (!png) {
            yerror("builtinTileSource: tile {}: {}", t, error_msg(png));
            continue;
        }
        info.tiles.push_back(TileEntry{t, "", png->size()});
        tiles.push_back(std::move(*png));
    }
    info.tileCount = static_cast<uint32_t>(tiles.size());
    return TileSource::createMemory(std::move(info), std::move(tiles));
}

Result<PathSet> parsePoints(const std::string& text) {
    PathSet paths;
    PointSequence current;
    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;

    auto flush = [&]() {
        if (!current.empty()) {
            paths.push_back(std::move(current));
            current.clear();
        }
    };

    while (std::getline(in, line)) {
        lineNo++;
        if (auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            flush();
            continue;
        }
        std::istringstream fields(line);
        float x = 0, y = 0, z = 0;
        if (!(fields >> x >> y)) {
            return Err<PathSet>(ErrorKind::Construction,
                                "points: line " + std::to_string(lineNo) + ": expected 'x y [z]'");
        }
        if (!(fields >> z)) {
            z = 0.0f;
        }
        current.emplace_back(x, y, z);
    }
    flush();
    return Ok(std::move(paths));
}

Result<PathSet> loadPointsFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<PathSet>(ErrorKind::Resource, "Cannot open points file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto paths = parsePoints(buffer.str());
    if (!paths) {
        return Err<PathSet>(path.string(), paths);
    }
    ydebug("loadPointsFile: {} paths from {}", paths->size(), path.string());
    return paths;
}

} // namespace rivvon
