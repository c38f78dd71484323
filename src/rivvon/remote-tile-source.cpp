#include <rivvon/tile-source.h>
#include <cpr/cpr.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <optional>

namespace rivvon {

//=============================================================================
// RemoteTileSource
//=============================================================================

class RemoteTileSource : public TileSource {
public:
    RemoteTileSource(RemoteTileConfig config, std::string textureId)
        : _config(std::move(config)), _textureId(std::move(textureId)) {}

    RemoteTileSource(RemoteTileConfig config, TileSetInfo descriptor)
        : _config(std::move(config)), _textureId(descriptor.id), _descriptor(std::move(descriptor)) {}

    Result<TileSetInfo> describe() override {
        if (_descriptor) {
            return Ok(*_descriptor);
        }

        std::string url = _config.apiBase + "/textures/" + _textureId;
        auto body = get(url);
        if (!body) {
            return Err<TileSetInfo>("texture set " + _textureId, body);
        }
        auto info = parseDescriptor(*body, _config.cdnBase);
        if (!info) {
            return Err<TileSetInfo>("texture set " + _textureId, info);
        }
        if (info->id.empty()) {
            info->id = _textureId;
        }
        yinfo("RemoteTileSource: '{}' {} tiles, {} layers, {}",
              info->name, info->tileCount, info->layerCount, toString(info->mode));
        _descriptor = *info;
        return info;
    }

    Result<std::vector<uint8_t>> fetchTile(const TileSetInfo& info, uint32_t index) override {
        auto it = std::find_if(info.tiles.begin(), info.tiles.end(),
                               [index](const TileEntry& t) { return t.index == index; });
        if (it == info.tiles.end() || it->url.empty()) {
            return Err<std::vector<uint8_t>>(ErrorKind::Resource,
                                             "no url for tile " + std::to_string(index));
        }
        auto body = get(it->url);
        if (!body) {
            return Err<std::vector<uint8_t>>("tile " + std::to_string(index), body);
        }
        if (it->fileSize != 0 && body->size() != it->fileSize) {
            ywarn("RemoteTileSource: tile {} is {} bytes, expected {}", index, body->size(), it->fileSize);
        }
        return Ok(std::vector<uint8_t>(body->begin(), body->end()));
    }

    std::string label() const override { return _config.apiBase + "/textures/" + _textureId; }

private:
    Result<std::string> get(const std::string& url) const {
        ydebug("RemoteTileSource: GET {}", url);

        cpr::Response r = cpr::Get(
            cpr::Url{url},
            cpr::Header{{"User-Agent", _config.userAgent}},
            cpr::Timeout{static_cast<int32_t>(_config.timeoutMs)},
            cpr::Redirect{10L}
        );

        if (r.status_code == 0) {
            return Err<std::string>(ErrorKind::Resource, "connection failed: " + r.error.message);
        }
        if (r.status_code >= 400) {
            return Err<std::string>(ErrorKind::Resource,
                                    "HTTP " + std::to_string(r.status_code) + " for " + url);
        }
        return Ok(std::move(r.text));
    }

    RemoteTileConfig _config;
    std::string _textureId;
    std::optional<TileSetInfo> _descriptor;
};

Result<TileSource::Ptr> TileSource::createRemote(const RemoteTileConfig& config,
                                                 const std::string& textureId) noexcept {
    if (textureId.empty()) {
        return Err<Ptr>(ErrorKind::State, "createRemote: empty texture id");
    }
    return Ok(std::make_shared<RemoteTileSource>(config, textureId));
}

Result<TileSource::Ptr> TileSource::createRemote(const RemoteTileConfig& config,
                                                 TileSetInfo descriptor) noexcept {
    if (descriptor.tiles.empty()) {
        return Err<Ptr>(ErrorKind::Resource, "createRemote: descriptor lists no tiles");
    }
    if (descriptor.tileCount == 0) {
        descriptor.tileCount = static_cast<uint32_t>(descriptor.tiles.size());
    }
    return Ok(std::make_shared<RemoteTileSource>(config, std::move(descriptor)));
}

} // namespace rivvon
