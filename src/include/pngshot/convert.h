#pragma once

#include "pngshot/console_format.h"
#include "pngshot/image_transcode.h"
#include "pngshot/metadata_tool.h"
#include "pngshot/png_insert.h"

#include <cstdint>
#include <string>

/**
 * \file convert.h
 * \brief Screenshot conversion pipeline (classify, preassemble, externalize
 * metadata, reposition, finalize).
 */

namespace pngshot {

/// Outcome of \ref convert_screenshot.
enum class ConvertStatus : uint8_t {
    Ok,
    /// Input is not a PNG/JPEG, or its chunk stream is truncated.
    FormatError,
    /// The metadata tool is not on `PATH`.
    MetadataToolNotFound,
    /// The metadata tool exited non-zero or could not be run.
    MetadataToolFailed,
    /// Reading the input or writing a temporary/destination file failed.
    IoError,
};

const char*
convert_status_name(ConvertStatus status) noexcept;

/// Conversion settings. Defaults reproduce iOS screenshot output.
struct ConvertOptions final {
    ConsoleLog log;

    /// Keep the original capture time (EXIF, then mtime) and restore the
    /// destination's mtime afterwards. When false, the current time is used.
    bool preserve_date = true;

    /// Read back ImageDescription and print the chunk order (Detail only).
    bool verify_output = true;

    /// exiftool executable (name on `PATH` or path).
    std::string metadata_tool = "exiftool";

    /// Hard cap on the input file size (0 = unlimited).
    uint64_t max_input_bytes = 0;

    /// Caps for JPEG inputs, so a small file with forged dimensions fails
    /// instead of allocating.
    TranscodeLimits transcode_limits;

    /// Tag values; `datetime` is filled in per conversion.
    ScreenshotMetadata metadata;

    ScreenshotChunkDefaults chunk_defaults;
};

struct ConvertResult final {
    ConvertStatus status = ConvertStatus::Ok;
    /// Destination path on success.
    std::string output_path;
    /// Human-readable failure detail.
    std::string message;

    bool ok() const noexcept { return status == ConvertStatus::Ok; }
};

/// `<input without extension>_ios.png`.
std::string
default_output_path(const std::string& input_path);

/**
 * \brief Converts one image into an iOS-style screenshot PNG.
 *
 * Temporaries are `<output>.temp_png` (JPEG input only) and `<output>.temp1`;
 * both are removed on every path. On failure no file is left at
 * \p output_path. An empty \p output_path selects \ref default_output_path.
 */
ConvertResult
convert_screenshot(const std::string& input_path,
                   const std::string& output_path,
                   const ConvertOptions& options);

}  // namespace pngshot
