#include "pngshot/png_chunk.h"
#include "pngshot/png_insert.h"

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

}  // namespace pngshot

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace pngshot;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    std::vector<std::byte> out;
    const ScreenshotChunkReport report
        = apply_screenshot_chunk_defaults(bytes, ScreenshotChunkDefaults {},
                                          &out);
    if (report.status != PngInsertStatus::Ok) {
        return 0;
    }
    size_t added = 0;
    if (report.phys_inserted) {
        added += kPngChunkOverhead + 9U;
    }
    if (report.sbit_inserted) {
        added += kPngChunkOverhead + 3U;
    }
    if (out.size() != bytes.size() + added) {
        fuzz_trap();
    }
    return 0;
}
