#include <rivvon/frame-encoding.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace rivvon {

// =============================================================================
// Still frames
// =============================================================================

Result<std::vector<uint8_t>> encodePng(const std::vector<uint8_t>& rgba, uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return Err<std::vector<uint8_t>>("encodePng: empty image");
    }
    if (rgba.size() != static_cast<size_t>(width) * height * 4) {
        return Err<std::vector<uint8_t>>("encodePng: expected " + std::to_string(width * height * 4) +
                                         " bytes, got " + std::to_string(rgba.size()));
    }

    std::vector<uint8_t> png;
    auto append = [](void* context, void* data, int size) {
        auto* out = static_cast<std::vector<uint8_t>*>(context);
        auto* bytes = static_cast<const uint8_t*>(data);
        out->insert(out->end(), bytes, bytes + size);
    };
    int ok = stbi_write_png_to_func(append, &png, static_cast<int>(width), static_cast<int>(height), 4,
                                    rgba.data(), static_cast<int>(width * 4));
    if (!ok) {
        return Err<std::vector<uint8_t>>("encodePng: stb_image_write failed");
    }
    return Ok(std::move(png));
}

Result<std::vector<uint8_t>> packReadback(const uint8_t* mapped, uint32_t width, uint32_t height,
                                          uint32_t bytesPerRow, bool bgra) {
    if (!mapped) {
        return Err<std::vector<uint8_t>>(ErrorKind::Resource, "packReadback: readback buffer is not mapped");
    }
    const uint32_t rowBytes = width * 4;
    if (bytesPerRow < rowBytes) {
        return Err<std::vector<uint8_t>>(ErrorKind::Construction,
                                         "packReadback: " + std::to_string(bytesPerRow) +
                                         " bytes per row, need " + std::to_string(rowBytes));
    }
    std::vector<uint8_t> pixels(static_cast<size_t>(rowBytes) * height);
    for (uint32_t y = 0; y < height; y++) {
        const uint8_t* src = mapped + static_cast<size_t>(y) * bytesPerRow;
        uint8_t* dst = pixels.data() + static_cast<size_t>(y) * rowBytes;
        for (uint32_t x = 0; x < width; x++) {
            dst[x * 4 + 0] = src[x * 4 + (bgra ? 2 : 0)];
            dst[x * 4 + 1] = src[x * 4 + 1];
            dst[x * 4 + 2] = src[x * 4 + (bgra ? 0 : 2)];
            dst[x * 4 + 3] = src[x * 4 + 3];
        }
    }
    return Ok(std::move(pixels));
}

// =============================================================================
// ClipEncoderImpl
// =============================================================================

class ClipEncoderImpl : public ClipEncoder {
public:
    explicit ClipEncoderImpl(const Config& config) noexcept : _config(config) {}
    ~ClipEncoderImpl() override;

    Result<void> init() noexcept;

    Result<void> writeFrame(const std::vector<uint8_t>& rgba) override;
    Result<std::vector<uint8_t>> finish() override;

    uint32_t framesWritten() const override { return _frames; }
    const std::string& outputPath() const override { return _outputPath; }

private:
    int closePipe();
    void removeOutput();

    Config _config;
    std::string _outputPath;
    FILE* _pipe = nullptr;
    uint32_t _frames = 0;
};

Result<ClipEncoder::Ptr> ClipEncoder::create(const Config& config) noexcept {
    auto encoder = std::make_shared<ClipEncoderImpl>(config);
    if (auto res = encoder->init(); !res) {
        return Err<Ptr>("Failed to start clip encoder", res);
    }
    return Ok(std::move(encoder));
}

Result<void> ClipEncoderImpl::init() noexcept {
    if (_config.width == 0 || _config.height == 0 || _config.fps == 0) {
        return Err(ErrorKind::Construction, "ClipEncoder: width, height and fps must be positive");
    }

    static std::atomic<uint32_t> clipCounter{0};
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return Err(ErrorKind::Resource, "ClipEncoder: no temporary directory: " + ec.message());
    }
    _outputPath = (dir / ("rivvon-clip-" + std::to_string(getpid()) + "-" +
                          std::to_string(clipCounter++) + ".webm")).string();

    std::ostringstream cmd;
    cmd << _config.ffmpeg
        << " -loglevel error -y"
        << " -f rawvideo"
        << " -pixel_format rgba"
        << " -video_size " << _config.width << "x" << _config.height
        << " -framerate " << _config.fps
        << " -i - "
        << "-c:v libvpx-vp9 -b:v 4M -pix_fmt yuv420p "
        << "\"" << _outputPath << "\"";

    ydebug("ClipEncoder: {}", cmd.str());
    _pipe = popen(cmd.str().c_str(), "w");
    if (!_pipe) {
        return Err(ErrorKind::Resource, "ClipEncoder: failed to start " + _config.ffmpeg);
    }
    return Ok();
}

ClipEncoderImpl::~ClipEncoderImpl() {
    if (_pipe) {
        closePipe();
    }
    removeOutput();
}

int ClipEncoderImpl::closePipe() {
    int status = pclose(_pipe);
    _pipe = nullptr;
    return status;
}

void ClipEncoderImpl::removeOutput() {
    if (_outputPath.empty()) return;
    std::error_code ec;
    std::filesystem::remove(_outputPath, ec);
}

Result<void> ClipEncoderImpl::writeFrame(const std::vector<uint8_t>& rgba) {
    if (!_pipe) {
        return Err(ErrorKind::State, "ClipEncoder: already finished");
    }
    const size_t expected = static_cast<size_t>(_config.width) * _config.height * 4;
    if (rgba.size() != expected) {
        return Err(ErrorKind::Construction, "ClipEncoder: frame has " + std::to_string(rgba.size()) +
                                                " bytes, expected " + std::to_string(expected));
    }
    size_t written = fwrite(rgba.data(), 1, rgba.size(), _pipe);
    if (written != rgba.size()) {
        return Err(ErrorKind::Resource, "ClipEncoder: pipe write short: " + std::to_string(written) +
                                            " / " + std::to_string(rgba.size()) + " bytes");
    }
    _frames++;
    return Ok();
}

Result<std::vector<uint8_t>> ClipEncoderImpl::finish() {
    if (!_pipe) {
        return Err<std::vector<uint8_t>>(ErrorKind::State, "ClipEncoder: already finished");
    }
    int status = closePipe();
    if (status != 0) {
        removeOutput();
        return Err<std::vector<uint8_t>>(ErrorKind::Resource,
                                         "ClipEncoder: " + _config.ffmpeg + " exited with status " +
                                             std::to_string(status));
    }

    std::ifstream file(_outputPath, std::ios::binary);
    if (!file) {
        removeOutput();
        return Err<std::vector<uint8_t>>(ErrorKind::Resource, "ClipEncoder: no output at " + _outputPath);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();
    removeOutput();

    yinfo("ClipEncoder: {} frames, {} bytes", _frames, bytes.size());
    return Ok(std::move(bytes));
}

} // namespace rivvon
