#pragma once

#include <rivvon/result.hpp>
#include <rivvon/tile-source.h>
#include <rivvon/types.h>
#include <filesystem>
#include <string>

namespace rivvon {

// Shown when no path file is given: one spiral rising along z
PathSet builtinSpiral(uint32_t turns = 3, uint32_t pointsPerTurn = 48);

// Procedural single-layer tiles (hue stripes), used when no tile source is configured
TileSource::Ptr builtinTileSource(uint32_t tileCount = 6, uint32_t tileSize = 64);

// One path per blank-line separated block, "x y [z]" per line, '#' comments
Result<PathSet> parsePoints(const std::string& text);
Result<PathSet> loadPointsFile(const std::filesystem::path& path);

} // namespace rivvon
