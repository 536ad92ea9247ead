#pragma once

#include "pngshot/png_chunk.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file png_insert.h
 * \brief Positional chunk insertion relative to an anchor chunk.
 */

namespace pngshot {

/// Status of \ref insert_png_chunk_after and \ref apply_screenshot_chunk_defaults.
enum class PngInsertStatus : uint8_t {
    Ok,
    /// Input does not start with the PNG signature.
    NotPng,
    /// Input is too short to end in an `IEND` record, or a chunk overruns it.
    Malformed,
};

struct PngInsertResult final {
    PngInsertStatus status = PngInsertStatus::Ok;
    /// Byte offset in the input at which the new chunk was spliced.
    uint64_t insert_offset = 0;
    /// False when the chunk went in front of the trailing `IEND` record.
    bool anchor_found = false;
};

/**
 * \brief Splices a newly encoded chunk right after the first \p anchor_type.
 *
 * The search walks raw length prefixes from the signature and never examines
 * the final 12 bytes, which are assumed to be the zero-length `IEND` record.
 * Without an anchor, the chunk is placed at `size - 12`: a file with bytes
 * trailing `IEND` gets the chunk in the wrong place. That assumption is kept
 * as is; callers feed buffers produced by \ref assemble_png or exiftool.
 *
 * \p out receives the full new buffer.
 */
PngInsertResult
insert_png_chunk_after(std::span<const std::byte> png, uint32_t anchor_type,
                       uint32_t new_type,
                       std::span<const std::byte> new_payload,
                       std::vector<std::byte>* out);

/// Payloads the screenshot layout adds when the file lacks them.
struct ScreenshotChunkDefaults final {
    /// pHYs pixels per unit, X and Y. 5669 px/m is 144 DPI.
    uint32_t pixels_per_unit_x = 5669;
    uint32_t pixels_per_unit_y = 5669;
    /// pHYs unit specifier: 1 = meter.
    uint8_t unit = 1;

    /// sBIT significant bits for R, G, B.
    std::array<uint8_t, 3> significant_bits = { 8, 8, 8 };
};

/// Serializes the `pHYs` payload (9 bytes) of \p defaults.
std::array<std::byte, 9>
make_phys_payload(const ScreenshotChunkDefaults& defaults) noexcept;

/// Serializes the `sBIT` payload (3 bytes) of \p defaults.
std::array<std::byte, 3>
make_sbit_payload(const ScreenshotChunkDefaults& defaults) noexcept;

/// What \ref apply_screenshot_chunk_defaults did.
struct ScreenshotChunkReport final {
    PngInsertStatus status = PngInsertStatus::Ok;
    bool phys_inserted     = false;
    bool sbit_inserted     = false;
    /// `pHYs` went after `eXIf` (false: in front of `IEND`, or not inserted).
    bool phys_after_exif = false;
};

/**
 * \brief Adds `pHYs` after `eXIf` and `sBIT` after `pHYs` when missing.
 *
 * Presence is checked on \p png before anything is inserted, so a chunk the
 * metadata tool carried over keeps its value and is never duplicated.
 * Applying this to its own output leaves the buffer unchanged.
 */
ScreenshotChunkReport
apply_screenshot_chunk_defaults(std::span<const std::byte> png,
                                const ScreenshotChunkDefaults& defaults,
                                std::vector<std::byte>* out);

}  // namespace pngshot
