#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file png_chunk.h
 * \brief PNG chunk codec: chunk encoding, CRC, and signature-first chunk walk.
 */

namespace pngshot {

/// Size of the fixed PNG file signature.
inline constexpr uint32_t kPngSignatureSize = 8;

/// Framing overhead of one chunk record: length (4) + type (4) + CRC (4).
inline constexpr uint32_t kPngChunkOverhead = 12;

/// `\x89PNG\r\n\x1a\n`.
inline constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
    std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
    std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
    std::byte { 0x1A }, std::byte { 0x0A },
};

static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

inline constexpr uint32_t kPngIhdr = fourcc('I', 'H', 'D', 'R');
inline constexpr uint32_t kPngSrgb = fourcc('s', 'R', 'G', 'B');
inline constexpr uint32_t kPngIdat = fourcc('I', 'D', 'A', 'T');
inline constexpr uint32_t kPngIend = fourcc('I', 'E', 'N', 'D');
inline constexpr uint32_t kPngExif = fourcc('e', 'X', 'I', 'f');
inline constexpr uint32_t kPngPhys = fourcc('p', 'H', 'Y', 's');
inline constexpr uint32_t kPngSbit = fourcc('s', 'B', 'I', 'T');

/// Status of \ref decode_png_chunks.
enum class PngChunkStatus : uint8_t {
    Ok,
    /// The first 8 bytes are not the PNG signature.
    NotPng,
    /// A chunk's declared length runs past the end of the buffer.
    Malformed,
};

/**
 * \brief One decoded chunk.
 *
 * `data` is a view into the buffer passed to \ref decode_png_chunks and is
 * only valid while that buffer is alive.
 */
struct PngChunk final {
    uint32_t type = 0;
    std::span<const std::byte> data;

    // Framed record (length + type + data + CRC) within the source buffer.
    uint64_t outer_offset = 0;
    uint64_t outer_size   = 0;
};

/// Returns `crc32(type ++ payload)` as stored in a chunk trailer.
uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> payload) noexcept;

/**
 * \brief Appends one framed chunk to \p out.
 *
 * Layout: `length(u32be) type payload crc32(type ++ payload)(u32be)`.
 * Payloads larger than `UINT32_MAX` are not supported.
 */
void
encode_png_chunk(uint32_t type, std::span<const std::byte> payload,
                 std::vector<std::byte>* out);

/// Appends the PNG signature to \p out.
void
append_png_signature(std::vector<std::byte>* out);

/// True if \p bytes starts with the PNG signature.
bool
has_png_signature(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes the chunk sequence of a PNG buffer.
 *
 * Walks chunks after the signature, reading length, type and payload. CRCs
 * are skipped, not verified. The walk stops after `IEND`; any bytes after it
 * are ignored. A buffer that ends without `IEND` decodes as `Ok` with the
 * chunks found.
 *
 * On `Malformed`, \p out holds the chunks decoded before the bad record.
 */
PngChunkStatus
decode_png_chunks(std::span<const std::byte> bytes,
                  std::vector<PngChunk>* out);

/// True if a chunk of \p type appears anywhere in the decoded sequence.
bool
png_contains_chunk(std::span<const std::byte> bytes, uint32_t type);

}  // namespace pngshot
