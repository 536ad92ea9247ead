#pragma once

#include "pngshot/png_chunk.h"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

/**
 * \file png_assemble.h
 * \brief Chunk classification and reassembly into the screenshot chunk order.
 */

namespace pngshot {

/**
 * \brief Chunks of one PNG, partitioned into the slots the reassembler orders.
 *
 * `IEND`, `eXIf`, `pHYs` and `sBIT` are dropped during classification: the
 * conversion pipeline re-adds them at fixed positions later.
 */
struct ClassifiedPngChunks final {
    std::optional<PngChunk> header;         // IHDR
    std::optional<PngChunk> color_profile;  // sRGB
    std::vector<PngChunk> others;           // original relative order
    std::vector<PngChunk> pixel_data;       // IDAT, original relative order
};

/// True for chunk types the pipeline writes itself (never kept in `others`).
bool
is_managed_png_chunk(uint32_t type) noexcept;

/// Partitions \p chunks. A repeated `IHDR` or `sRGB` replaces the earlier one.
ClassifiedPngChunks
classify_png_chunks(std::span<const PngChunk> chunks);

/**
 * \brief Writes a PNG with chunks in the required order into \p out.
 *
 * Order: signature, `IHDR` (only if present), `sRGB` (synthesized with
 * rendering intent 0 when absent), `others`, `IDAT`s, empty `IEND`.
 * \p out is cleared first.
 */
void
assemble_png(const ClassifiedPngChunks& chunks, std::vector<std::byte>* out);

}  // namespace pngshot
