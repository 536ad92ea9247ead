#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <span>
#include <string>

/**
 * \file exif_datetime.h
 * \brief Capture timestamp lookup for the metadata written to screenshots.
 */

namespace pngshot {

/// Where \ref derive_capture_datetime found its value.
enum class DatetimeSource : uint8_t {
    ExifDateTimeOriginal,
    FileModifyTime,
    CurrentTime,
};

const char*
datetime_source_name(DatetimeSource source) noexcept;

/**
 * \brief Locates the TIFF stream of the first EXIF block in \p bytes.
 *
 * Supports JPEG (`APP1` with `Exif\0\0`) and PNG (`eXIf` chunk). Returns an
 * empty span if there is none.
 */
std::span<const std::byte>
find_exif_tiff(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Reads EXIF DateTimeOriginal (0x9003) from a TIFF stream.
 *
 * IFD0 is searched first, then the Exif sub-IFD (0x8769). The value is
 * trimmed of trailing NULs and spaces. Returns false if not present or empty.
 */
bool
find_exif_datetime_original(std::span<const std::byte> tiff,
                            std::string* out);

/// Formats \p t in local time as `YYYY:MM:DD HH:MM:SS`.
bool
format_exif_datetime(std::time_t t, std::string* out);

/**
 * \brief Chooses the timestamp embedded into a converted screenshot.
 *
 * With \p preserve_date: DateTimeOriginal of \p original_bytes, else the
 * modification time of \p original_path, else now. Without it: now.
 */
DatetimeSource
derive_capture_datetime(std::span<const std::byte> original_bytes,
                        const char* original_path, bool preserve_date,
                        std::string* out);

}  // namespace pngshot
