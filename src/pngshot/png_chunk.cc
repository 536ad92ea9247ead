#include "pngshot/png_chunk.h"

#include "byte_order_internal.h"

#include <cstring>

#include <zlib.h>

namespace pngshot {

using byte_order_internal::append_u32be;
using byte_order_internal::read_u32be;

uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> payload) noexcept
{
    const Bytef type_bytes[4] = {
        static_cast<Bytef>((type >> 24) & 0xFF),
        static_cast<Bytef>((type >> 16) & 0xFF),
        static_cast<Bytef>((type >> 8) & 0xFF),
        static_cast<Bytef>((type >> 0) & 0xFF),
    };
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc       = ::crc32(crc, type_bytes, 4);

    // crc32() with a null buffer returns the seed value, not `crc`.
    const Bytef* p   = reinterpret_cast<const Bytef*>(payload.data());
    size_t remaining = payload.size();
    while (remaining != 0U) {
        const uInt n = remaining > 0x40000000U
                           ? 0x40000000U
                           : static_cast<uInt>(remaining);
        crc          = ::crc32(crc, p, n);
        p += n;
        remaining -= n;
    }
    return static_cast<uint32_t>(crc & 0xFFFFFFFFUL);
}


void
encode_png_chunk(uint32_t type, std::span<const std::byte> payload,
                 std::vector<std::byte>* out)
{
    out->reserve(out->size() + payload.size() + kPngChunkOverhead);
    append_u32be(out, static_cast<uint32_t>(payload.size()));
    append_u32be(out, type);
    out->insert(out->end(), payload.begin(), payload.end());
    append_u32be(out, png_chunk_crc(type, payload));
}


void
append_png_signature(std::vector<std::byte>* out)
{
    out->insert(out->end(), kPngSignature.begin(), kPngSignature.end());
}


bool
has_png_signature(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < kPngSignatureSize) {
        return false;
    }
    return std::memcmp(bytes.data(), kPngSignature.data(), kPngSignatureSize)
           == 0;
}


PngChunkStatus
decode_png_chunks(std::span<const std::byte> bytes,
                  std::vector<PngChunk>* out)
{
    out->clear();
    if (!has_png_signature(bytes)) {
        return PngChunkStatus::NotPng;
    }

    uint64_t offset = kPngSignatureSize;
    while (offset + kPngChunkOverhead <= bytes.size()) {
        uint32_t len  = 0;
        uint32_t type = 0;
        if (!read_u32be(bytes, offset, &len)
            || !read_u32be(bytes, offset + 4, &type)) {
            return PngChunkStatus::Malformed;
        }
        const uint64_t data_off   = offset + 8;
        const uint64_t data_size  = static_cast<uint64_t>(len);
        const uint64_t chunk_size = kPngChunkOverhead + data_size;
        if (data_off + data_size + 4 > bytes.size()) {
            return PngChunkStatus::Malformed;
        }

        PngChunk chunk;
        chunk.type         = type;
        chunk.data         = bytes.subspan(static_cast<size_t>(data_off),
                                           static_cast<size_t>(data_size));
        chunk.outer_offset = offset;
        chunk.outer_size   = chunk_size;
        out->push_back(chunk);

        offset += chunk_size;
        if (type == kPngIend) {
            break;
        }
    }
    return PngChunkStatus::Ok;
}


bool
png_contains_chunk(std::span<const std::byte> bytes, uint32_t type)
{
    std::vector<PngChunk> chunks;
    // A truncated tail still reports the chunks before it.
    (void)decode_png_chunks(bytes, &chunks);
    for (const PngChunk& chunk : chunks) {
        if (chunk.type == type) {
            return true;
        }
    }
    return false;
}

}  // namespace pngshot
