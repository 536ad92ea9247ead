// Minimal exiftool stand-in for tests. Understands the three invocations
// pngshot makes:
//   tag write:   -overwrite_original [...] -Tag=value ... <file>
//   orientation: -Orientation=1 -n -overwrite_original <file>
//   read back:   -s3 -ImageDescription <file>
// Tag writes replace the eXIf chunk with a little-endian TIFF holding
// ImageDescription and an Exif IFD with DateTimeOriginal, placed before the
// first IDAT.
//
// Environment:
//   PNGSHOT_FAKE_EXIFTOOL_FAIL  exit 1 with a diagnostic on stderr
//   PNGSHOT_FAKE_EXIFTOOL_LOG   append each argument vector to this file

#include "pngshot/file_io.h"
#include "pngshot/png_chunk.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace pngshot {
namespace {

    static void append_u16le(std::vector<std::byte>* out, uint16_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    }


    static void append_u32le(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    }


    static void append_ascii_entry(std::vector<std::byte>* out, uint16_t tag,
                                   uint32_t count, uint32_t value_off)
    {
        append_u16le(out, tag);
        append_u16le(out, 2);
        append_u32le(out, count);
        append_u32le(out, value_off);
    }


    static void append_text(std::vector<std::byte>* out, std::string_view s)
    {
        for (char c : s) {
            out->push_back(std::byte { static_cast<uint8_t>(c) });
        }
        out->push_back(std::byte { 0 });
    }


    static std::vector<std::byte> make_tiff(const std::string& description,
                                            const std::string& datetime)
    {
        // IFD0: ImageDescription, ExifIFD pointer. Exif IFD: DateTimeOriginal.
        // Values are always stored out of line (padded to > 4 bytes).
        const std::string desc = description.size() < 4
                                     ? description + std::string(4, ' ')
                                     : description;
        const std::string dt   = datetime.size() < 4
                                     ? datetime + std::string(4, ' ')
                                     : datetime;
        const uint32_t ifd0_off = 8;
        const uint32_t exif_off = ifd0_off + 2 + 2 * 12 + 4;
        const uint32_t desc_off = exif_off + 2 + 12 + 4;
        const uint32_t dt_off   = desc_off
                                + static_cast<uint32_t>(desc.size() + 1);

        std::vector<std::byte> t;
        t.push_back(std::byte { 'I' });
        t.push_back(std::byte { 'I' });
        append_u16le(&t, 42);
        append_u32le(&t, ifd0_off);

        append_u16le(&t, 2);
        append_ascii_entry(&t, 0x010E, static_cast<uint32_t>(desc.size() + 1),
                           desc_off);
        append_u16le(&t, 0x8769);
        append_u16le(&t, 4);
        append_u32le(&t, 1);
        append_u32le(&t, exif_off);
        append_u32le(&t, 0);

        append_u16le(&t, 1);
        append_ascii_entry(&t, 0x9003, static_cast<uint32_t>(dt.size() + 1),
                           dt_off);
        append_u32le(&t, 0);

        append_text(&t, desc);
        append_text(&t, dt);
        return t;
    }


    static uint32_t read_u32le(std::span<const std::byte> b, size_t off)
    {
        if (off + 4 > b.size()) {
            return 0;
        }
        return static_cast<uint32_t>(b[off])
               | (static_cast<uint32_t>(b[off + 1]) << 8)
               | (static_cast<uint32_t>(b[off + 2]) << 16)
               | (static_cast<uint32_t>(b[off + 3]) << 24);
    }


    static uint16_t read_u16le(std::span<const std::byte> b, size_t off)
    {
        if (off + 2 > b.size()) {
            return 0;
        }
        return static_cast<uint16_t>(static_cast<uint32_t>(b[off])
                                     | (static_cast<uint32_t>(b[off + 1])
                                        << 8));
    }


    static std::string read_description(std::span<const std::byte> tiff)
    {
        const uint32_t ifd0 = read_u32le(tiff, 4);
        const uint16_t n    = read_u16le(tiff, ifd0);
        for (uint16_t i = 0; i < n; ++i) {
            const size_t e = ifd0 + 2U + i * 12U;
            if (read_u16le(tiff, e) != 0x010E) {
                continue;
            }
            const uint32_t count = read_u32le(tiff, e + 4);
            const uint32_t off   = read_u32le(tiff, e + 8);
            if (count == 0 || off + count > tiff.size()) {
                return {};
            }
            std::string s(reinterpret_cast<const char*>(tiff.data() + off),
                          count - 1);
            while (!s.empty() && s.back() == ' ') {
                s.pop_back();
            }
            return s;
        }
        return {};
    }


    static bool has_arg(int argc, char** argv, const char* want)
    {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], want) == 0) {
                return true;
            }
        }
        return false;
    }


    static bool find_tag_value(int argc, char** argv, std::string_view prefix,
                               std::string* out)
    {
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg(argv[i]);
            if (arg.substr(0, prefix.size()) == prefix) {
                out->assign(arg.substr(prefix.size()));
                return true;
            }
        }
        return false;
    }


    static void log_args(int argc, char** argv)
    {
        const char* log_path = std::getenv("PNGSHOT_FAKE_EXIFTOOL_LOG");
        if (!log_path || !*log_path) {
            return;
        }
        std::FILE* f = std::fopen(log_path, "ab");
        if (!f) {
            return;
        }
        for (int i = 1; i < argc; ++i) {
            std::fprintf(f, "%s%s", i > 1 ? " " : "", argv[i]);
        }
        std::fprintf(f, "\n");
        std::fclose(f);
    }


    static int read_back(const char* path)
    {
        std::vector<std::byte> bytes;
        if (read_file_bytes(path, 0, &bytes) != FileIoStatus::Ok) {
            std::fprintf(stderr, "Error: File not found - %s\n", path);
            return 1;
        }
        std::vector<PngChunk> chunks;
        (void)decode_png_chunks(bytes, &chunks);
        for (const PngChunk& c : chunks) {
            if (c.type == kPngExif) {
                const std::string desc = read_description(c.data);
                if (!desc.empty()) {
                    std::printf("%s\n", desc.c_str());
                }
                break;
            }
        }
        return 0;
    }


    static int touch(const char* path)
    {
        std::vector<std::byte> bytes;
        if (read_file_bytes(path, 0, &bytes) != FileIoStatus::Ok
            || write_file_bytes(path, bytes) != FileIoStatus::Ok) {
            std::fprintf(stderr, "Error: cannot rewrite %s\n", path);
            return 1;
        }
        return 0;
    }


    static int write_tags(int argc, char** argv, const char* path)
    {
        std::string description;
        std::string datetime;
        (void)find_tag_value(argc, argv, "-ImageDescription=", &description);
        (void)find_tag_value(argc, argv, "-DateTimeOriginal=", &datetime);

        std::vector<std::byte> bytes;
        if (read_file_bytes(path, 0, &bytes) != FileIoStatus::Ok) {
            std::fprintf(stderr, "Error: File not found - %s\n", path);
            return 1;
        }
        std::vector<PngChunk> chunks;
        if (decode_png_chunks(bytes, &chunks) != PngChunkStatus::Ok) {
            std::fprintf(stderr, "Error: File format error - %s\n", path);
            return 1;
        }

        const std::vector<std::byte> tiff = make_tiff(description, datetime);
        bool placed                       = false;
        std::vector<std::byte> out;
        append_png_signature(&out);
        for (const PngChunk& c : chunks) {
            if (c.type == kPngExif) {
                continue;
            }
            if (!placed && (c.type == kPngIdat || c.type == kPngIend)) {
                encode_png_chunk(kPngExif, tiff, &out);
                placed = true;
            }
            encode_png_chunk(c.type, c.data, &out);
        }
        if (write_file_bytes(path, out) != FileIoStatus::Ok) {
            std::fprintf(stderr, "Error: cannot write %s\n", path);
            return 1;
        }
        std::printf("    1 image files updated\n");
        return 0;
    }

}  // namespace
}  // namespace pngshot

int
main(int argc, char** argv)
{
    using namespace pngshot;

    log_args(argc, argv);
    if (argc < 2) {
        std::fprintf(stderr, "fake_exiftool: no file\n");
        return 1;
    }
    const char* path = argv[argc - 1];

    const char* fail = std::getenv("PNGSHOT_FAKE_EXIFTOOL_FAIL");
    if (fail && *fail) {
        std::fprintf(stderr, "Error: simulated failure - %s\n", path);
        return 1;
    }

    if (has_arg(argc, argv, "-s3")) {
        return read_back(path);
    }
    if (has_arg(argc, argv, "-n")) {
        return touch(path);
    }
    return write_tags(argc, argv, path);
}
