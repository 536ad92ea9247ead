#include "pngshot/png_assemble.h"

#include <array>

namespace pngshot {
namespace {

    // sRGB rendering intent 0: perceptual.
    static constexpr std::array<std::byte, 1> kDefaultSrgbPayload = {
        std::byte { 0x00 },
    };

}  // namespace

bool
is_managed_png_chunk(uint32_t type) noexcept
{
    return type == kPngIend || type == kPngExif || type == kPngPhys
           || type == kPngSbit;
}


ClassifiedPngChunks
classify_png_chunks(std::span<const PngChunk> chunks)
{
    ClassifiedPngChunks out;
    for (const PngChunk& chunk : chunks) {
        if (chunk.type == kPngIhdr) {
            out.header = chunk;
        } else if (chunk.type == kPngSrgb) {
            out.color_profile = chunk;
        } else if (chunk.type == kPngIdat) {
            out.pixel_data.push_back(chunk);
        } else if (!is_managed_png_chunk(chunk.type)) {
            out.others.push_back(chunk);
        }
    }
    return out;
}


void
assemble_png(const ClassifiedPngChunks& chunks, std::vector<std::byte>* out)
{
    out->clear();

    size_t reserve = kPngSignatureSize + 3U * kPngChunkOverhead
                     + kDefaultSrgbPayload.size();
    if (chunks.header) {
        reserve += chunks.header->data.size();
    }
    for (const PngChunk& c : chunks.others) {
        reserve += kPngChunkOverhead + c.data.size();
    }
    for (const PngChunk& c : chunks.pixel_data) {
        reserve += kPngChunkOverhead + c.data.size();
    }
    out->reserve(reserve);

    append_png_signature(out);
    if (chunks.header) {
        encode_png_chunk(kPngIhdr, chunks.header->data, out);
    }
    if (chunks.color_profile) {
        encode_png_chunk(kPngSrgb, chunks.color_profile->data, out);
    } else {
        encode_png_chunk(kPngSrgb, kDefaultSrgbPayload, out);
    }
    for (const PngChunk& c : chunks.others) {
        encode_png_chunk(c.type, c.data, out);
    }
    for (const PngChunk& c : chunks.pixel_data) {
        encode_png_chunk(c.type, c.data, out);
    }
    encode_png_chunk(kPngIend, {}, out);
}

}  // namespace pngshot
