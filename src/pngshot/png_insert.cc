#include "pngshot/png_insert.h"

#include "byte_order_internal.h"

namespace pngshot {

using byte_order_internal::read_u32be;

PngInsertResult
insert_png_chunk_after(std::span<const std::byte> png, uint32_t anchor_type,
                       uint32_t new_type,
                       std::span<const std::byte> new_payload,
                       std::vector<std::byte>* out)
{
    PngInsertResult result;
    out->clear();

    if (!has_png_signature(png)) {
        result.status = PngInsertStatus::NotPng;
        return result;
    }
    if (png.size() < kPngSignatureSize + kPngChunkOverhead) {
        result.status = PngInsertStatus::Malformed;
        return result;
    }

    const uint64_t tail_off = png.size() - kPngChunkOverhead;
    uint64_t offset         = kPngSignatureSize;
    while (offset < tail_off) {
        uint32_t len  = 0;
        uint32_t type = 0;
        if (!read_u32be(png, offset, &len)
            || !read_u32be(png, offset + 4, &type)) {
            result.status = PngInsertStatus::Malformed;
            return result;
        }
        const uint64_t chunk_end = offset + kPngChunkOverhead
                                   + static_cast<uint64_t>(len);
        if (chunk_end > png.size()) {
            result.status = PngInsertStatus::Malformed;
            return result;
        }
        if (type == anchor_type) {
            result.insert_offset = chunk_end;
            result.anchor_found  = true;
            break;
        }
        offset = chunk_end;
    }
    if (!result.anchor_found) {
        result.insert_offset = tail_off;
    }

    const size_t split = static_cast<size_t>(result.insert_offset);
    out->reserve(png.size() + kPngChunkOverhead + new_payload.size());
    out->insert(out->end(), png.begin(), png.begin() + split);
    encode_png_chunk(new_type, new_payload, out);
    out->insert(out->end(), png.begin() + split, png.end());
    return result;
}


std::array<std::byte, 9>
make_phys_payload(const ScreenshotChunkDefaults& defaults) noexcept
{
    const uint32_t x = defaults.pixels_per_unit_x;
    const uint32_t y = defaults.pixels_per_unit_y;
    return {
        std::byte { static_cast<uint8_t>((x >> 24) & 0xFF) },
        std::byte { static_cast<uint8_t>((x >> 16) & 0xFF) },
        std::byte { static_cast<uint8_t>((x >> 8) & 0xFF) },
        std::byte { static_cast<uint8_t>((x >> 0) & 0xFF) },
        std::byte { static_cast<uint8_t>((y >> 24) & 0xFF) },
        std::byte { static_cast<uint8_t>((y >> 16) & 0xFF) },
        std::byte { static_cast<uint8_t>((y >> 8) & 0xFF) },
        std::byte { static_cast<uint8_t>((y >> 0) & 0xFF) },
        std::byte { defaults.unit },
    };
}


std::array<std::byte, 3>
make_sbit_payload(const ScreenshotChunkDefaults& defaults) noexcept
{
    return {
        std::byte { defaults.significant_bits[0] },
        std::byte { defaults.significant_bits[1] },
        std::byte { defaults.significant_bits[2] },
    };
}


ScreenshotChunkReport
apply_screenshot_chunk_defaults(std::span<const std::byte> png,
                                const ScreenshotChunkDefaults& defaults,
                                std::vector<std::byte>* out)
{
    ScreenshotChunkReport report;
    out->clear();

    if (!has_png_signature(png)) {
        report.status = PngInsertStatus::NotPng;
        return report;
    }

    const bool has_phys = png_contains_chunk(png, kPngPhys);
    const bool has_sbit = png_contains_chunk(png, kPngSbit);

    std::vector<std::byte> current(png.begin(), png.end());
    std::vector<std::byte> next;

    if (!has_phys) {
        const std::array<std::byte, 9> phys = make_phys_payload(defaults);
        const PngInsertResult r = insert_png_chunk_after(current, kPngExif,
                                                         kPngPhys, phys, &next);
        if (r.status != PngInsertStatus::Ok) {
            report.status = r.status;
            return report;
        }
        report.phys_inserted   = true;
        report.phys_after_exif = r.anchor_found;
        current.swap(next);
    }

    if (!has_sbit) {
        const std::array<std::byte, 3> sbit = make_sbit_payload(defaults);
        const PngInsertResult r = insert_png_chunk_after(current, kPngPhys,
                                                         kPngSbit, sbit, &next);
        if (r.status != PngInsertStatus::Ok) {
            report.status = r.status;
            return report;
        }
        report.sbit_inserted = true;
        current.swap(next);
    }

    out->swap(current);
    return report;
}

}  // namespace pngshot
