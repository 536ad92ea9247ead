#include "pngshot/exif_datetime.h"

#include "byte_order_internal.h"
#include "pngshot/file_io.h"
#include "pngshot/png_chunk.h"

#include <cstring>
#include <ctime>
#include <utility>

namespace pngshot {
namespace {

    using byte_order_internal::read_u16be;
    using byte_order_internal::read_u16le;
    using byte_order_internal::read_u32be;
    using byte_order_internal::read_u32le;
    using byte_order_internal::u8;

    static constexpr uint16_t kTagDateTimeOriginal = 0x9003;
    static constexpr uint16_t kTagExifIfdPointer   = 0x8769;
    static constexpr uint16_t kTiffTypeAscii       = 2;
    static constexpr uint16_t kTiffTypeLong        = 4;
    static constexpr uint16_t kTiffTypeIfd         = 13;
    static constexpr uint16_t kMaxIfdEntries       = 1024;

    struct TiffReader final {
        std::span<const std::byte> bytes;
        bool le = true;

        bool u16(uint64_t offset, uint16_t* out) const noexcept
        {
            return le ? read_u16le(bytes, offset, out)
                      : read_u16be(bytes, offset, out);
        }

        bool u32(uint64_t offset, uint32_t* out) const noexcept
        {
            return le ? read_u32le(bytes, offset, out)
                      : read_u32be(bytes, offset, out);
        }
    };

    struct IfdEntry final {
        uint16_t tag   = 0;
        uint16_t type  = 0;
        uint32_t count = 0;
        // Offset of the 4-byte value/offset field.
        uint64_t value_field = 0;
    };

    static bool find_ifd_entry(const TiffReader& r, uint32_t ifd_off,
                               uint16_t tag, IfdEntry* out) noexcept
    {
        uint16_t count = 0;
        if (!r.u16(ifd_off, &count) || count > kMaxIfdEntries) {
            return false;
        }
        for (uint16_t i = 0; i < count; ++i) {
            const uint64_t entry_off = static_cast<uint64_t>(ifd_off) + 2U
                                       + static_cast<uint64_t>(i) * 12U;
            IfdEntry e;
            if (!r.u16(entry_off + 0, &e.tag) || !r.u16(entry_off + 2, &e.type)
                || !r.u32(entry_off + 4, &e.count)) {
                return false;
            }
            if (e.tag == tag) {
                e.value_field = entry_off + 8;
                *out          = e;
                return true;
            }
        }
        return false;
    }

    static bool read_ascii_value(const TiffReader& r, const IfdEntry& e,
                                 std::string* out)
    {
        if (e.type != kTiffTypeAscii || e.count == 0U) {
            return false;
        }
        uint64_t value_off = e.value_field;
        if (e.count > 4U) {
            uint32_t off = 0;
            if (!r.u32(e.value_field, &off)) {
                return false;
            }
            value_off = off;
        }
        if (value_off + e.count > r.bytes.size()) {
            return false;
        }

        std::string s(reinterpret_cast<const char*>(r.bytes.data() + value_off),
                      static_cast<size_t>(e.count));
        const size_t nul = s.find('\0');
        if (nul != std::string::npos) {
            s.resize(nul);
        }
        while (!s.empty() && s.back() == ' ') {
            s.pop_back();
        }
        if (s.empty()) {
            return false;
        }
        *out = std::move(s);
        return true;
    }

    static std::span<const std::byte>
    find_png_exif(std::span<const std::byte> bytes) noexcept
    {
        uint64_t offset = kPngSignatureSize;
        while (offset + kPngChunkOverhead <= bytes.size()) {
            uint32_t len  = 0;
            uint32_t type = 0;
            if (!read_u32be(bytes, offset, &len)
                || !read_u32be(bytes, offset + 4, &type)) {
                return {};
            }
            const uint64_t data_off = offset + 8;
            if (data_off + len + 4 > bytes.size()) {
                return {};
            }
            if (type == kPngExif) {
                return bytes.subspan(static_cast<size_t>(data_off), len);
            }
            if (type == kPngIend) {
                return {};
            }
            offset = data_off + len + 4;
        }
        return {};
    }

    static std::span<const std::byte>
    find_jpeg_exif(std::span<const std::byte> bytes) noexcept
    {
        uint64_t offset = 2;
        while (offset + 4 <= bytes.size()) {
            if (u8(bytes[offset]) != 0xFF) {
                return {};
            }
            // Fill bytes.
            while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
                offset += 1;
            }
            if (offset >= bytes.size()) {
                return {};
            }
            const uint8_t marker = u8(bytes[offset]);
            offset += 1;
            if (marker == 0xD9 || marker == 0xDA) {
                return {};
            }
            if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) {
                continue;
            }

            uint16_t seg_len = 0;
            if (!read_u16be(bytes, offset, &seg_len) || seg_len < 2) {
                return {};
            }
            const uint64_t payload_off  = offset + 2;
            const uint64_t payload_size = static_cast<uint64_t>(seg_len) - 2U;
            if (payload_off + payload_size > bytes.size()) {
                return {};
            }
            if (marker == 0xE1 && payload_size > 6
                && std::memcmp(bytes.data() + payload_off, "Exif\0\0", 6)
                       == 0) {
                return bytes.subspan(static_cast<size_t>(payload_off + 6),
                                     static_cast<size_t>(payload_size - 6));
            }
            offset = payload_off + payload_size;
        }
        return {};
    }

}  // namespace

const char*
datetime_source_name(DatetimeSource source) noexcept
{
    switch (source) {
    case DatetimeSource::ExifDateTimeOriginal: return "exif_datetime_original";
    case DatetimeSource::FileModifyTime: return "file_mtime";
    case DatetimeSource::CurrentTime: return "current_time";
    }
    return "unknown";
}


std::span<const std::byte>
find_exif_tiff(std::span<const std::byte> bytes) noexcept
{
    if (has_png_signature(bytes)) {
        return find_png_exif(bytes);
    }
    if (bytes.size() >= 4 && u8(bytes[0]) == 0xFF && u8(bytes[1]) == 0xD8) {
        return find_jpeg_exif(bytes);
    }
    return {};
}


bool
find_exif_datetime_original(std::span<const std::byte> tiff, std::string* out)
{
    if (tiff.size() < 8) {
        return false;
    }

    TiffReader r;
    r.bytes = tiff;
    if (u8(tiff[0]) == 'I' && u8(tiff[1]) == 'I') {
        r.le = true;
    } else if (u8(tiff[0]) == 'M' && u8(tiff[1]) == 'M') {
        r.le = false;
    } else {
        return false;
    }

    uint16_t magic = 0;
    uint32_t ifd0  = 0;
    if (!r.u16(2, &magic) || magic != 42 || !r.u32(4, &ifd0)) {
        return false;
    }

    IfdEntry entry;
    if (find_ifd_entry(r, ifd0, kTagDateTimeOriginal, &entry)
        && read_ascii_value(r, entry, out)) {
        return true;
    }

    if (!find_ifd_entry(r, ifd0, kTagExifIfdPointer, &entry)) {
        return false;
    }
    if (entry.type != kTiffTypeLong && entry.type != kTiffTypeIfd) {
        return false;
    }
    uint32_t exif_ifd = 0;
    if (!r.u32(entry.value_field, &exif_ifd) || exif_ifd == ifd0) {
        return false;
    }
    return find_ifd_entry(r, exif_ifd, kTagDateTimeOriginal, &entry)
           && read_ascii_value(r, entry, out);
}


bool
format_exif_datetime(std::time_t t, std::string* out)
{
    std::tm local {};
    if (!::localtime_r(&t, &local)) {
        return false;
    }
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y:%m:%d %H:%M:%S",
                                   &local);
    if (n == 0U) {
        return false;
    }
    out->assign(buf, n);
    return true;
}


DatetimeSource
derive_capture_datetime(std::span<const std::byte> original_bytes,
                        const char* original_path, bool preserve_date,
                        std::string* out)
{
    if (preserve_date) {
        if (find_exif_datetime_original(find_exif_tiff(original_bytes), out)) {
            return DatetimeSource::ExifDateTimeOriginal;
        }
        FileTime mtime;
        if (read_file_mtime(original_path, &mtime) == FileIoStatus::Ok
            && format_exif_datetime(static_cast<std::time_t>(mtime.seconds),
                                    out)) {
            return DatetimeSource::FileModifyTime;
        }
    }
    if (!format_exif_datetime(std::time(nullptr), out)) {
        out->assign("1970:01:01 00:00:00");
    }
    return DatetimeSource::CurrentTime;
}

}  // namespace pngshot
