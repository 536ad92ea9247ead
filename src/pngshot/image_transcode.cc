#include "pngshot/image_transcode.h"

#include "pngshot/png_chunk.h"

#include <csetjmp>
#include <cstdio>
#include <string>

#include <jpeglib.h>
// Include libpng last
#include <png.h>

namespace pngshot {
namespace {

    struct RgbImage final {
        uint32_t width  = 0;
        uint32_t height = 0;
        std::vector<uint8_t> pixels;  // width * height * 3
    };

    struct JpegDecoder final {
        jpeg_decompress_struct cinfo {};
        jpeg_error_mgr jerr {};
        std::jmp_buf jmpbuf;
        std::string message;
        bool created = false;

        JpegDecoder() noexcept
        {
            cinfo.err         = ::jpeg_std_error(&jerr);
            jerr.error_exit   = &error_exit;
            jerr.emit_message = &emit_message;
            cinfo.client_data = this;
        }

        ~JpegDecoder()
        {
            if (created) {
                ::jpeg_destroy_decompress(&cinfo);
            }
        }

        [[noreturn]] static void error_exit(j_common_ptr info)
        {
            auto* self = static_cast<JpegDecoder*>(info->client_data);
            char buffer[JMSG_LENGTH_MAX];
            (*info->err->format_message)(info, buffer);
            self->message = buffer;
            std::longjmp(self->jmpbuf, 1);
        }

        // Warnings (e.g. premature end of data) are tolerated.
        static void emit_message(j_common_ptr, int) {}
    };

    // One RGB channel from a CMYK ink and black sample. Adobe files store
    // samples inverted (255 = no ink).
    static uint8_t cmyk_to_rgb_channel(uint8_t ink, uint8_t black,
                                       bool inverted) noexcept
    {
        const uint32_t a = inverted ? ink : 255U - ink;
        const uint32_t b = inverted ? black : 255U - black;
        return static_cast<uint8_t>((a * b + 127U) / 255U);
    }


    static void cmyk_row_to_rgb(const uint8_t* cmyk, uint32_t width,
                                bool inverted, uint8_t* rgb) noexcept
    {
        for (uint32_t x = 0; x < width; ++x) {
            const uint8_t* p = cmyk + static_cast<size_t>(x) * 4U;
            uint8_t* q       = rgb + static_cast<size_t>(x) * 3U;
            q[0]             = cmyk_to_rgb_channel(p[0], p[3], inverted);
            q[1]             = cmyk_to_rgb_channel(p[1], p[3], inverted);
            q[2]             = cmyk_to_rgb_channel(p[2], p[3], inverted);
        }
    }


    static TranscodeResult decode_jpeg(std::span<const std::byte> jpeg,
                                       const TranscodeLimits& limits,
                                       RgbImage* image)
    {
        TranscodeResult result;
        JpegDecoder dec;
        bool too_large = false;
        // Lives outside the setjmp frame so a longjmp never skips its
        // destructor.
        std::vector<uint8_t> cmyk_row;

        const bool ok = [&]() {
            // setjmp in a lambda with no locals needing cleanup.
            if (setjmp(dec.jmpbuf)) {
                return false;
            }
            jpeg_create_decompress(&dec.cinfo);
            dec.created = true;
            ::jpeg_mem_src(&dec.cinfo,
                           reinterpret_cast<const unsigned char*>(jpeg.data()),
                           static_cast<unsigned long>(jpeg.size()));
            (void)::jpeg_read_header(&dec.cinfo, TRUE);

            const bool cmyk = dec.cinfo.jpeg_color_space == JCS_CMYK
                              || dec.cinfo.jpeg_color_space == JCS_YCCK;
            dec.cinfo.out_color_space = cmyk ? JCS_CMYK : JCS_RGB;
            ::jpeg_calc_output_dimensions(&dec.cinfo);

            image->width  = dec.cinfo.output_width;
            image->height = dec.cinfo.output_height;
            const uint64_t decoded_bytes = static_cast<uint64_t>(image->width)
                                           * image->height * 3U;
            if (limits.max_decoded_bytes != 0
                && decoded_bytes > limits.max_decoded_bytes) {
                too_large = true;
                return false;
            }

            (void)::jpeg_start_decompress(&dec.cinfo);
            const size_t stride = static_cast<size_t>(image->width) * 3U;
            image->pixels.resize(static_cast<size_t>(decoded_bytes));
            if (cmyk) {
                cmyk_row.resize(static_cast<size_t>(image->width) * 4U);
            }
            const bool inverted = dec.cinfo.saw_Adobe_marker != 0;
            while (dec.cinfo.output_scanline < dec.cinfo.output_height) {
                uint8_t* dst = image->pixels.data()
                               + stride * dec.cinfo.output_scanline;
                JSAMPROW row = cmyk ? cmyk_row.data() : dst;
                if (::jpeg_read_scanlines(&dec.cinfo, &row, 1) != 1) {
                    break;
                }
                if (cmyk) {
                    cmyk_row_to_rgb(cmyk_row.data(), image->width, inverted,
                                    dst);
                }
            }
            (void)::jpeg_finish_decompress(&dec.cinfo);
            return true;
        }();

        if (too_large) {
            result.status  = TranscodeStatus::LimitExceeded;
            result.message = "decoded image of "
                             + std::to_string(image->width) + "x"
                             + std::to_string(image->height)
                             + " exceeds the decode limit of "
                             + std::to_string(limits.max_decoded_bytes)
                             + " bytes";
        } else if (!ok) {
            result.status  = TranscodeStatus::Malformed;
            result.message = dec.message;
        }
        result.width  = image->width;
        result.height = image->height;
        return result;
    }

    struct PngEncodeState final {
        std::vector<std::byte>* out = nullptr;
        std::string message;
    };

    static void png_write_to_vector(png_structp png_ptr, png_bytep data,
                                    png_size_t size)
    {
        auto* state = static_cast<PngEncodeState*>(png_get_io_ptr(png_ptr));
        const std::byte* p = reinterpret_cast<const std::byte*>(data);
        state->out->insert(state->out->end(), p, p + size);
    }

    static void png_flush_noop(png_structp) {}

    static void png_error_to_state(png_structp png_ptr,
                                   png_const_charp error_message)
    {
        auto* state = static_cast<PngEncodeState*>(png_get_error_ptr(png_ptr));
        state->message = error_message ? error_message : "libpng error";
        longjmp(png_jmpbuf(png_ptr), 1);
    }

    static void png_warning_ignored(png_structp, png_const_charp) {}

    static TranscodeResult encode_png(const RgbImage& image,
                                      std::vector<std::byte>* out)
    {
        TranscodeResult result;
        result.width  = image.width;
        result.height = image.height;

        PngEncodeState state;
        state.out = out;

        png_structp png_ptr = ::png_create_write_struct(PNG_LIBPNG_VER_STRING,
                                                        &state,
                                                        &png_error_to_state,
                                                        &png_warning_ignored);
        if (!png_ptr) {
            result.status  = TranscodeStatus::EncodeFailed;
            result.message = "png_create_write_struct failed";
            return result;
        }
        png_infop info_ptr = ::png_create_info_struct(png_ptr);
        if (!info_ptr) {
            ::png_destroy_write_struct(&png_ptr, nullptr);
            result.status  = TranscodeStatus::EncodeFailed;
            result.message = "png_create_info_struct failed";
            return result;
        }

        std::vector<png_bytep> rows(image.height);
        const size_t stride = static_cast<size_t>(image.width) * 3U;
        for (uint32_t y = 0; y < image.height; ++y) {
            rows[y] = const_cast<png_bytep>(image.pixels.data() + stride * y);
        }

        const bool ok = [&]() {
            if (setjmp(png_jmpbuf(png_ptr))) {
                return false;
            }
            ::png_set_write_fn(png_ptr, &state, &png_write_to_vector,
                               &png_flush_noop);
            ::png_set_IHDR(png_ptr, info_ptr, image.width, image.height, 8,
                           PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                           PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
            ::png_write_info(png_ptr, info_ptr);
            ::png_write_image(png_ptr, rows.data());
            ::png_write_end(png_ptr, nullptr);
            return true;
        }();

        ::png_destroy_write_struct(&png_ptr, &info_ptr);
        if (!ok) {
            out->clear();
            result.status  = TranscodeStatus::EncodeFailed;
            result.message = state.message;
        }
        return result;
    }

}  // namespace

const char*
image_format_name(ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Unknown: return "unknown";
    case ImageFormat::Png: return "png";
    case ImageFormat::Jpeg: return "jpeg";
    }
    return "unknown";
}


ImageFormat
detect_image_format(std::span<const std::byte> bytes) noexcept
{
    if (has_png_signature(bytes)) {
        return ImageFormat::Png;
    }
    if (bytes.size() >= 3 && bytes[0] == std::byte { 0xFF }
        && bytes[1] == std::byte { 0xD8 } && bytes[2] == std::byte { 0xFF }) {
        return ImageFormat::Jpeg;
    }
    return ImageFormat::Unknown;
}


const char*
transcode_status_name(TranscodeStatus status) noexcept
{
    switch (status) {
    case TranscodeStatus::Ok: return "ok";
    case TranscodeStatus::Unsupported: return "unsupported";
    case TranscodeStatus::Malformed: return "malformed";
    case TranscodeStatus::EncodeFailed: return "encode_failed";
    case TranscodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


TranscodeResult
transcode_jpeg_to_png(std::span<const std::byte> jpeg,
                      const TranscodeLimits& limits,
                      std::vector<std::byte>* out)
{
    out->clear();
    if (detect_image_format(jpeg) != ImageFormat::Jpeg) {
        TranscodeResult result;
        result.status  = TranscodeStatus::Unsupported;
        result.message = "not a JPEG stream";
        return result;
    }

    RgbImage image;
    const TranscodeResult decoded = decode_jpeg(jpeg, limits, &image);
    if (decoded.status != TranscodeStatus::Ok) {
        return decoded;
    }
    return encode_png(image, out);
}

}  // namespace pngshot
