#include "pngshot/batch.h"
#include "pngshot/build_info.h"
#include "pngshot/console_format.h"
#include "pngshot/convert.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

namespace pngshot {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [output.png]\n"
            "       %s [options] <directory> [output-dir]\n"
            "\n"
            "Rewrites screenshots (PNG or JPEG) into iOS-style screenshot PNGs:\n"
            "chunk order IHDR, sRGB, eXIf, pHYs, sBIT, IDAT, IEND with\n"
            "screenshot EXIF tags written by exiftool.\n"
            "\n"
            "A directory is processed recursively into one flat output directory\n"
            "(default: <directory>/ios_output). A single file is written to\n"
            "<name>_ios.png unless an output path is given.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print pngshot build info\n"
            "  --no-build-info        Hide build info header\n"
            "  -q, --quiet            Print errors only\n"
            "  --no-preserve-date     Use the current time instead of the\n"
            "                         original capture/modification time\n"
            "  --no-verify            Skip the read-back of ImageDescription\n"
            "                         and the chunk order listing\n"
            "  --exiftool <path>      exiftool executable (default: exiftool)\n"
            "  --max-file-bytes N     Optional input size cap in bytes\n"
            "                         (default: 0=unlimited)\n"
            "  --max-decoded-bytes N  Cap on a decoded JPEG (width*height*3)\n"
            "                         (default: 536870912, 0=unlimited)\n",
            argv0 ? argv0 : "pngshot", argv0 ? argv0 : "pngshot");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static void run_single(const std::string& input,
                           const std::string& output,
                           const ConvertOptions& options)
    {
        const ConsoleLog& log = options.log;
        console_detail(log, "== %s", input.c_str());
        const ConvertResult r = convert_screenshot(input, output, options);
        if (!r.ok()) {
            console_error(log, "%s: %s: %s", input.c_str(),
                          convert_status_name(r.status), r.message.c_str());
            return;
        }
        console_summary(log, "%s -> %s", input.c_str(),
                        r.output_path.c_str());
    }

}  // namespace
}  // namespace pngshot

int
main(int argc, char** argv)
{
    using namespace pngshot;

    bool show_build_info = true;
    ConvertOptions options;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            options.log.verbosity = Verbosity::Quiet;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-preserve-date") == 0) {
            options.preserve_date = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-verify") == 0) {
            options.verify_output = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--exiftool") == 0) {
            if (i + 1 >= argc || !argv[i + 1] || argv[i + 1][0] == '\0') {
                std::fprintf(stderr, "invalid --exiftool value\n");
                return 1;
            }
            options.metadata_tool = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0) {
            if (i + 1 >= argc
                || !parse_u64_arg(argv[i + 1], &options.max_input_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 1;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-decoded-bytes") == 0) {
            if (i + 1 >= argc
                || !parse_u64_arg(
                    argv[i + 1],
                    &options.transcode_limits.max_decoded_bytes)) {
                std::fprintf(stderr, "invalid --max-decoded-bytes value\n");
                return 1;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "pngshot: unknown option %s\n", arg);
            return 1;
        }
        break;
    }

    const int positional = argc - first_path;
    if (positional < 1 || positional > 2 || !argv[first_path]
        || argv[first_path][0] == '\0') {
        usage(argv[0]);
        return 1;
    }
    const std::string input = argv[first_path];
    const std::string output = (positional == 2 && argv[first_path + 1])
                                   ? std::string(argv[first_path + 1])
                                   : std::string();

    std::error_code ec;
    const std::filesystem::file_status st = std::filesystem::status(input, ec);
    const bool is_dir  = !ec && std::filesystem::is_directory(st);
    const bool is_file = !ec && std::filesystem::is_regular_file(st);
    if (!is_dir && !is_file) {
        console_error(options.log, "%s: no such file or directory",
                      input.c_str());
        return 1;
    }

    if (show_build_info && options.log.verbosity != Verbosity::Quiet) {
        print_build_info_header();
    }

    if (is_dir) {
        BatchOptions batch;
        batch.convert    = options;
        batch.output_dir = output;
        const BatchSummary summary = convert_directory(input, batch);
        return summary.output_dir_ok ? 0 : 1;
    }
    // Conversion failures are reported above and do not change the exit code.
    run_single(input, output, options);
    return 0;
}
