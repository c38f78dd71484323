//=============================================================================
// rivvon - tile-textured ribbon viewer
//
// Main entry point. Parses the command line, builds the Viewer, loads a tile
// set and the ribbon paths, then runs the event loop.
//=============================================================================

#include <rivvon/builtin-content.h>
#include <rivvon/viewer.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <args.hxx>
#include <fstream>
#include <iostream>
#include <signal.h>

using namespace rivvon;

static Result<void> writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Err(ErrorKind::Resource, "Cannot write " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return Err(ErrorKind::Resource, "Short write to " + path);
    }
    return Ok();
}

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("rivvon - tile-textured ribbon viewer");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<std::string> tilesArg(parser, "dir", "Local tile set directory", {'t', "tiles"});
    args::ValueFlag<std::string> remoteArg(parser, "id", "Remote texture set id", {'r', "remote"});
    args::ValueFlag<std::string> pointsArg(parser, "file", "Path points file (x y [z], blank line between paths)",
                                           {'p', "svg-points"});
    args::ValueFlag<std::string> flowArg(parser, "state", "Flow: off, forward or backward", {'f', "flow"});
    args::ValueFlag<float> widthArg(parser, "width", "Ribbon width", {'w', "width"});
    args::ValueFlag<std::string> exportArg(parser, "png", "Write one frame as PNG and exit", {"export-frame"});
    args::ValueFlag<std::string> logLevelArg(parser, "level", "trace, debug, info, warn, error", {'l', "log-level"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    spdlog::set_level(logLevelArg ? spdlog::level::from_str(args::get(logLevelArg)) : spdlog::level::info);
    spdlog::cfg::load_env_levels();

    // ffmpeg exiting early must not kill the viewer
    signal(SIGPIPE, SIG_IGN);

    // Build command line overrides for config
    YAML::Node cmdOverrides;
    if (tilesArg) {
        cmdOverrides["tiles"]["source"] = args::get(tilesArg);
    }
    if (flowArg) {
        cmdOverrides["flow"]["state"] = args::get(flowArg);
    }
    if (widthArg) {
        cmdOverrides["ribbon"]["width"] = args::get(widthArg);
    }

    auto config = Config::create(configFile ? args::get(configFile) : "", cmdOverrides);
    if (!config) {
        yerror("Failed to create config: {}", error_msg(config));
        return 1;
    }

    auto created = Viewer::create(*config);
    if (!created) {
        yerror("Failed to initialize rivvon: {}", error_msg(created));
        return 1;
    }
    auto viewer = *created;

    // Tile set: remote (async), directory, or the built-in stripes
    std::string tileSource = (*config)->get<std::string>(Config::KEY_TILES_SOURCE, "");
    if (remoteArg) {
        if (auto res = viewer->loadTexturesFromRemote(args::get(remoteArg)); !res) {
            yerror("{}", error_msg(res));
            return 1;
        }
    } else if (!tileSource.empty()) {
        auto source = TileSource::createDirectory(tileSource);
        if (!source) {
            yerror("{}", error_msg(source));
            return 1;
        }
        if (auto res = viewer->loadTextures(**source); !res) {
            yerror("{}", error_msg(res));
            return 1;
        }
    } else {
        auto source = builtinTileSource();
        if (auto res = viewer->loadTextures(*source); !res) {
            yerror("{}", error_msg(res));
            return 1;
        }
    }

    PathSet paths = builtinSpiral();
    if (pointsArg) {
        auto loaded = loadPointsFile(args::get(pointsArg));
        if (!loaded) {
            yerror("{}", error_msg(loaded));
            return 1;
        }
        paths = std::move(*loaded);
    }
    auto handle = viewer->buildRibbonSeries(paths, viewer->state().ribbonWidth());
    if (!handle) {
        yerror("Failed to build ribbons: {}", error_msg(handle));
        return 1;
    }

    if (exportArg) {
        // wait for a remote tile set before capturing
        while (!viewer->tileCache() && viewer->state().loadProgress().loading) {
            uv_run(viewer->eventLoop(), UV_RUN_ONCE);
        }
        auto png = viewer->exportCurrentFrame();
        if (!png) {
            yerror("Export failed: {}", error_msg(png));
            return 1;
        }
        if (auto res = writeFile(args::get(exportArg), *png); !res) {
            yerror("{}", error_msg(res));
            return 1;
        }
        yinfo("Wrote {} ({} bytes)", args::get(exportArg), png->size());
        return 0;
    }

    return viewer->run();
}
