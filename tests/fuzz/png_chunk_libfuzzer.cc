#include "pngshot/png_assemble.h"
#include "pngshot/png_chunk.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace pngshot {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_chunks(std::span<const std::byte> bytes,
              std::span<const PngChunk> chunks) noexcept
{
    const uint64_t size = static_cast<uint64_t>(bytes.size());
    uint64_t prev_end   = kPngSignatureSize;
    for (const PngChunk& c : chunks) {
        if (c.outer_offset != prev_end || c.outer_offset + c.outer_size > size) {
            fuzz_trap();
        }
        if (c.outer_size != kPngChunkOverhead + c.data.size()) {
            fuzz_trap();
        }
        prev_end = c.outer_offset + c.outer_size;
    }
}

}  // namespace pngshot

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace pngshot;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    std::vector<PngChunk> chunks;
    const PngChunkStatus st = decode_png_chunks(bytes, &chunks);
    verify_chunks(bytes, chunks);
    if (st != PngChunkStatus::Ok) {
        return 0;
    }

    // Reassembled output always decodes and ends in IEND.
    std::vector<std::byte> out;
    assemble_png(classify_png_chunks(chunks), &out);
    std::vector<PngChunk> again;
    if (decode_png_chunks(out, &again) != PngChunkStatus::Ok || again.empty()
        || again.back().type != kPngIend) {
        fuzz_trap();
    }
    return 0;
}
