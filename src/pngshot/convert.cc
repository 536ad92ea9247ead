#include "pngshot/convert.h"

#include "pngshot/exif_datetime.h"
#include "pngshot/file_io.h"
#include "pngshot/image_transcode.h"
#include "pngshot/png_assemble.h"
#include "pngshot/png_chunk.h"

#include <span>
#include <utility>
#include <vector>

namespace pngshot {
namespace {

    static ConvertResult failure(ConvertStatus status, std::string message)
    {
        ConvertResult result;
        result.status  = status;
        result.message = std::move(message);
        return result;
    }


    static std::string io_message(const char* what, const std::string& path,
                                  FileIoStatus status)
    {
        std::string out(what);
        out.append(" ");
        out.append(path);
        out.append(": ");
        out.append(file_io_status_name(status));
        return out;
    }


    static std::string tool_message(const MetadataToolResult& tool)
    {
        std::string out("metadata tool ");
        out.append(metadata_tool_status_name(tool.status));
        if (tool.status == MetadataToolStatus::Failed) {
            out.append(" (exit ");
            out.append(std::to_string(tool.exit_code));
            out.append(")");
        }
        if (!tool.diagnostics.empty()) {
            out.append(": ");
            (void)append_console_escaped_ascii(tool.diagnostics, 512, &out);
        }
        return out;
    }


    static std::string chunk_order_line(std::span<const PngChunk> chunks)
    {
        std::string out;
        size_t i = 0;
        while (i < chunks.size()) {
            size_t run = 1;
            while (i + run < chunks.size()
                   && chunks[i + run].type == chunks[i].type) {
                run += 1;
            }
            if (!out.empty()) {
                out.append(" -> ");
            }
            append_fourcc_name(chunks[i].type, &out);
            if (run > 1) {
                out.append(" x");
                out.append(std::to_string(run));
            }
            i += run;
        }
        return out;
    }

    // Result of a step whose failure is reported but never fails a conversion.
    struct AdvisoryOutcome final {
        bool ok = true;
        std::string detail;
    };

    template<typename Fn>
    static void run_advisory(const ConsoleLog& log, const char* name, Fn&& fn)
    {
        const AdvisoryOutcome outcome = fn();
        if (outcome.ok) {
            if (!outcome.detail.empty()) {
                console_detail(log, "  %s: %s", name, outcome.detail.c_str());
            }
            return;
        }
        console_warning(log, "%s: %s", name, outcome.detail.c_str());
    }


    static AdvisoryOutcome fix_orientation(const ConvertOptions& options,
                                           const std::string& output)
    {
        AdvisoryOutcome outcome;
        const MetadataToolResult tool
            = force_orientation_normal(options.metadata_tool, output);
        if (tool.status != MetadataToolStatus::Ok) {
            outcome.ok     = false;
            outcome.detail = tool_message(tool);
        }
        return outcome;
    }


    static AdvisoryOutcome restore_mtime(const std::string& input,
                                         const std::string& output)
    {
        AdvisoryOutcome outcome;
        FileTime mtime;
        FileIoStatus st = read_file_mtime(input.c_str(), &mtime);
        if (st == FileIoStatus::Ok) {
            st = set_file_mtime(output.c_str(), mtime);
        }
        if (st != FileIoStatus::Ok) {
            outcome.ok     = false;
            outcome.detail = file_io_status_name(st);
        }
        return outcome;
    }


    static AdvisoryOutcome verify_description(const ConvertOptions& options,
                                              const std::string& output)
    {
        AdvisoryOutcome outcome;
        const MetadataToolResult tool
            = read_image_description(options.metadata_tool, output);
        if (tool.status != MetadataToolStatus::Ok) {
            outcome.ok     = false;
            outcome.detail = tool_message(tool);
            return outcome;
        }
        std::string shown;
        (void)append_console_escaped_ascii(tool.output, 128, &shown);
        if (tool.output != options.metadata.description) {
            outcome.ok     = false;
            outcome.detail = "unexpected value \"" + shown + "\"";
            return outcome;
        }
        outcome.detail = shown;
        return outcome;
    }


    static AdvisoryOutcome verify_chunk_order(const std::string& output)
    {
        AdvisoryOutcome outcome;
        std::vector<std::byte> bytes;
        const FileIoStatus st = read_file_bytes(output.c_str(), 0, &bytes);
        if (st != FileIoStatus::Ok) {
            outcome.ok     = false;
            outcome.detail = file_io_status_name(st);
            return outcome;
        }
        std::vector<PngChunk> chunks;
        if (decode_png_chunks(bytes, &chunks) != PngChunkStatus::Ok) {
            outcome.ok     = false;
            outcome.detail = "output does not decode as PNG";
            return outcome;
        }
        outcome.detail = chunk_order_line(chunks);
        return outcome;
    }

}  // namespace

const char*
convert_status_name(ConvertStatus status) noexcept
{
    switch (status) {
    case ConvertStatus::Ok: return "ok";
    case ConvertStatus::FormatError: return "format_error";
    case ConvertStatus::MetadataToolNotFound: return "metadata_tool_not_found";
    case ConvertStatus::MetadataToolFailed: return "metadata_tool_failed";
    case ConvertStatus::IoError: return "io_error";
    }
    return "unknown";
}


std::string
default_output_path(const std::string& input_path)
{
    const size_t sep = input_path.find_last_of('/');
    const size_t dot = input_path.find_last_of('.');
    std::string out;
    if (dot != std::string::npos && dot != 0U
        && (sep == std::string::npos || dot > sep + 1U)) {
        out = input_path.substr(0, dot);
    } else {
        out = input_path;
    }
    out.append("_ios.png");
    return out;
}


ConvertResult
convert_screenshot(const std::string& input_path,
                   const std::string& output_path,
                   const ConvertOptions& options)
{
    const ConsoleLog& log    = options.log;
    const std::string output = output_path.empty()
                                   ? default_output_path(input_path)
                                   : output_path;

    // Classify.
    std::vector<std::byte> original;
    FileIoStatus io = read_file_bytes(input_path.c_str(),
                                      options.max_input_bytes, &original);
    if (io != FileIoStatus::Ok) {
        return failure(ConvertStatus::IoError,
                       io_message("read", input_path, io));
    }

    ScopedTempFile temp_png;
    std::vector<std::byte> transcoded;
    std::span<const std::byte> png(original.data(), original.size());

    const ImageFormat format = detect_image_format(original);
    if (format == ImageFormat::Jpeg) {
        console_detail(log, "non-PNG input (%s), converting to PNG...",
                       image_format_name(format));
        const TranscodeResult tr = transcode_jpeg_to_png(
            original, options.transcode_limits, &transcoded);
        if (tr.status != TranscodeStatus::Ok) {
            return failure(ConvertStatus::FormatError,
                           std::string("jpeg transcode ")
                               + transcode_status_name(tr.status) + ": "
                               + tr.message);
        }
        temp_png = ScopedTempFile(output + ".temp_png");
        io       = write_file_bytes(temp_png.path().c_str(), transcoded);
        if (io != FileIoStatus::Ok) {
            return failure(ConvertStatus::IoError,
                           io_message("write", temp_png.path(), io));
        }
        console_detail(log, "converted to PNG: %s (%ux%u)",
                       temp_png.path().c_str(), tr.width, tr.height);
        png = std::span<const std::byte>(transcoded.data(), transcoded.size());
    } else if (format != ImageFormat::Png) {
        return failure(ConvertStatus::FormatError,
                       "unsupported image format (expected PNG or JPEG)");
    }

    ScreenshotMetadata fields = options.metadata;
    const DatetimeSource source
        = derive_capture_datetime(original, input_path.c_str(),
                                  options.preserve_date, &fields.datetime);
    console_detail(log, "capture time: %s (%s)", fields.datetime.c_str(),
                   datetime_source_name(source));

    std::vector<PngChunk> chunks;
    const PngChunkStatus decoded = decode_png_chunks(png, &chunks);
    if (decoded != PngChunkStatus::Ok) {
        return failure(ConvertStatus::FormatError,
                       decoded == PngChunkStatus::NotPng
                           ? "not a valid PNG file"
                           : "truncated PNG chunk stream");
    }
    const ClassifiedPngChunks classified = classify_png_chunks(chunks);
    if (!classified.header) {
        console_warning(log, "%s: no IHDR chunk", input_path.c_str());
    }

    // Preassemble.
    std::vector<std::byte> intermediate;
    assemble_png(classified, &intermediate);
    console_detail(log, "base PNG: sRGB %s, %zu other chunk(s), %zu IDAT",
                   classified.color_profile ? "kept" : "added",
                   classified.others.size(), classified.pixel_data.size());

    // Externalize metadata.
    ScopedTempFile temp_meta(output + ".temp1");
    io = write_file_bytes(temp_meta.path().c_str(), intermediate);
    if (io != FileIoStatus::Ok) {
        return failure(ConvertStatus::IoError,
                       io_message("write", temp_meta.path(), io));
    }

    const MetadataToolResult tool
        = write_screenshot_metadata(options.metadata_tool, input_path, fields,
                                    temp_meta.path());
    if (tool.status == MetadataToolStatus::NotFound) {
        console_warning(log,
                        "%s not found on PATH; install exiftool "
                        "(e.g. apt install libimage-exiftool-perl)",
                        options.metadata_tool.c_str());
        return failure(ConvertStatus::MetadataToolNotFound,
                       tool_message(tool));
    }
    if (tool.status != MetadataToolStatus::Ok) {
        const std::string message = tool_message(tool);
        console_warning(log, "%s", message.c_str());
        return failure(ConvertStatus::MetadataToolFailed, message);
    }
    console_detail(log, "metadata written by %s",
                   options.metadata_tool.c_str());

    // Reposition.
    std::vector<std::byte> tagged;
    io = read_file_bytes(temp_meta.path().c_str(), 0, &tagged);
    if (io != FileIoStatus::Ok) {
        return failure(ConvertStatus::IoError,
                       io_message("read", temp_meta.path(), io));
    }

    std::vector<std::byte> final_png;
    const ScreenshotChunkReport report
        = apply_screenshot_chunk_defaults(tagged, options.chunk_defaults,
                                          &final_png);
    if (report.status != PngInsertStatus::Ok) {
        return failure(ConvertStatus::FormatError,
                       "metadata tool output is not a valid PNG");
    }
    if (report.phys_inserted && !report.phys_after_exif) {
        console_warning(log, "%s: no eXIf chunk, pHYs placed before IEND",
                        output.c_str());
    }
    console_detail(log, "pHYs %s, sBIT %s",
                   report.phys_inserted ? "added" : "kept",
                   report.sbit_inserted ? "added" : "kept");

    // Finalize.
    io = write_file_bytes(output.c_str(), final_png);
    if (io != FileIoStatus::Ok) {
        return failure(ConvertStatus::IoError,
                       io_message("write", output, io));
    }
    if (!temp_meta.remove()) {
        console_warning(log, "could not remove %s", temp_meta.path().c_str());
    }
    if (!temp_png.remove()) {
        console_warning(log, "could not remove %s", temp_png.path().c_str());
    }

    // The orientation rewrite touches the file, so mtime is restored after it.
    run_advisory(log, "orientation fix",
                 [&]() { return fix_orientation(options, output); });
    if (options.preserve_date) {
        run_advisory(log, "mtime restore",
                     [&]() { return restore_mtime(input_path, output); });
    }
    if (options.verify_output && log.verbosity >= Verbosity::Detail) {
        run_advisory(log, "ImageDescription",
                     [&]() { return verify_description(options, output); });
        run_advisory(log, "chunk order",
                     [&]() { return verify_chunk_order(output); });
    }

    console_detail(log, "converted: %s", output.c_str());

    ConvertResult result;
    result.output_path = output;
    return result;
}

}  // namespace pngshot
