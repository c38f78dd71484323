#pragma once

#include <rivvon/result.hpp>
#include <rivvon/tile-set.h>
#include <cstdint>
#include <memory>

namespace rivvon {

// Opaque handle to one uploaded tile (a layered texture)
struct TextureId {
    uint32_t id;

    bool isValid() const { return id != 0; }
    static TextureId invalid() { return {0}; }
    bool operator==(const TextureId&) const = default;
};

/**
 * TileTextureManager owns the GPU textures backing tiles.
 *
 * TileCache is its only client: it uploads every tile once at load time and
 * releases them all on dispose.
 */
class TileTextureManager {
public:
    using Ptr = std::shared_ptr<TileTextureManager>;

    virtual ~TileTextureManager() = default;

    virtual Result<TextureId> upload(const DecodedTile& tile) = 0;
    virtual Result<void> release(TextureId id) = 0;

    virtual bool supportsFormat(TileFormat format) const = 0;
    virtual uint32_t liveTextureCount() const = 0;

protected:
    TileTextureManager() = default;
};

} // namespace rivvon
