#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file image_transcode.h
 * \brief Format sniffing and JPEG to PNG transcoding for non-PNG inputs.
 */

namespace pngshot {

enum class ImageFormat : uint8_t {
    Unknown,
    Png,
    Jpeg,
};

const char*
image_format_name(ImageFormat format) noexcept;

/// Identifies \p bytes by signature (never by file extension).
ImageFormat
detect_image_format(std::span<const std::byte> bytes) noexcept;

enum class TranscodeStatus : uint8_t {
    Ok,
    /// Input is not a JPEG, or uses a color space that cannot become RGB.
    Unsupported,
    /// libjpeg rejected the data.
    Malformed,
    /// libpng failed to encode.
    EncodeFailed,
    /// Declared dimensions exceed \ref TranscodeLimits.
    LimitExceeded,
};

const char*
transcode_status_name(TranscodeStatus status) noexcept;

struct TranscodeResult final {
    TranscodeStatus status = TranscodeStatus::Ok;
    uint32_t width         = 0;
    uint32_t height        = 0;
    /// Codec library message on failure.
    std::string message;
};

/// Decode caps, checked against the header before any pixel buffer exists.
struct TranscodeLimits final {
    /// Cap on the decoded RGB image (`width * height * 3`); 0 = unlimited.
    uint64_t max_decoded_bytes = 512ULL * 1024ULL * 1024ULL;
};

/**
 * \brief Decodes a JPEG and re-encodes it as an 8-bit RGB PNG.
 *
 * Grayscale and YCbCr sources are converted to RGB by libjpeg. CMYK and
 * YCCK sources are decoded as CMYK and converted per pixel; an Adobe marker
 * means the samples are stored inverted. The PNG holds only
 * `IHDR`, `IDAT` and `IEND`; metadata is carried over separately by the
 * metadata tool. \p out is replaced.
 */
TranscodeResult
transcode_jpeg_to_png(std::span<const std::byte> jpeg,
                      const TranscodeLimits& limits,
                      std::vector<std::byte>* out);

}  // namespace pngshot
