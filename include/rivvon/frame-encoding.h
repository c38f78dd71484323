#pragma once

#include <rivvon/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rivvon {

// PNG bytes for tightly packed, top-down RGBA8 pixels
Result<std::vector<uint8_t>> encodePng(const std::vector<uint8_t>& rgba, uint32_t width, uint32_t height);

// Strip the row padding of a GPU readback and swap BGRA to RGBA if needed.
// A null mapping is a ResourceError.
Result<std::vector<uint8_t>> packReadback(const uint8_t* mapped, uint32_t width, uint32_t height,
                                          uint32_t bytesPerRow, bool bgra);

struct ClipEncoderConfig {
    std::string ffmpeg = "ffmpeg";
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t fps = 30;
};

/**
 * ClipEncoder pipes raw RGBA frames into an ffmpeg process encoding WebM
 * (VP9) into a temporary file. finish() closes the pipe and returns the file
 * contents; the temporary file is always removed.
 */
class ClipEncoder {
public:
    using Config = ClipEncoderConfig;
    using Ptr = std::shared_ptr<ClipEncoder>;

    static Result<Ptr> create(const Config& config) noexcept;

    virtual ~ClipEncoder() = default;

    virtual Result<void> writeFrame(const std::vector<uint8_t>& rgba) = 0;
    virtual Result<std::vector<uint8_t>> finish() = 0;

    virtual uint32_t framesWritten() const = 0;
    virtual const std::string& outputPath() const = 0;

protected:
    ClipEncoder() = default;
};

} // namespace rivvon
