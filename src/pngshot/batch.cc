#include "pngshot/batch.h"

#include <algorithm>
#include <filesystem>
#include <new>
#include <string_view>
#include <system_error>

namespace pngshot {
namespace {

    namespace fs = std::filesystem;

    static constexpr const char* kSupportedExtensions[] = {
        ".png", ".PNG", ".jpg", ".JPG", ".jpeg", ".JPEG",
    };

    static std::string lower_ascii(std::string s) noexcept
    {
        for (char& c : s) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return s;
    }


    static std::string lower_extension(const fs::path& p)
    {
        return lower_ascii(p.extension().string());
    }


    static bool same_directory(const fs::path& a, const fs::path& b)
    {
        std::error_code ec;
        const bool same = fs::equivalent(a, b, ec);
        return !ec && same;
    }

}  // namespace

bool
is_supported_image_name(const std::string& path) noexcept
{
    const size_t dot = path.find_last_of('.');
    const size_t sep = path.find_last_of('/');
    if (dot == std::string::npos || (sep != std::string::npos && dot < sep)) {
        return false;
    }
    const std::string_view ext(path.data() + dot, path.size() - dot);
    for (const char* known : kSupportedExtensions) {
        if (ext == known) {
            return true;
        }
    }
    return false;
}


std::vector<std::string>
collect_image_files(const std::string& dir, const std::string& exclude_dir)
{
    std::vector<std::string> files;
    const bool has_exclude = !exclude_dir.empty();

    std::error_code ec;
    fs::recursive_directory_iterator it(
        dir, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        const fs::directory_entry& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (has_exclude && same_directory(entry.path(), exclude_dir)) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(type_ec)) {
            const std::string path = entry.path().string();
            if (is_supported_image_name(path)) {
                files.push_back(path);
            }
        }
        it.increment(ec);
    }

    std::sort(files.begin(), files.end());
    return files;
}


std::string
batch_output_filename(const std::string& input)
{
    const fs::path p(input);
    const std::string ext = lower_extension(p);
    if (ext == ".jpg" || ext == ".jpeg") {
        return p.stem().string() + ".png";
    }
    return p.filename().string();
}


std::string
OutputNameAllocator::allocate(const std::string& filename)
{
    if (used_.insert(filename).second) {
        return filename;
    }

    const fs::path p(filename);
    const std::string stem = p.stem().string();
    const std::string ext  = p.extension().string();
    for (uint32_t n = 1;; ++n) {
        std::string candidate = stem + "_" + std::to_string(n) + ext;
        if (used_.insert(candidate).second) {
            return candidate;
        }
    }
}


BatchSummary
convert_directory(const std::string& dir, const BatchOptions& options)
{
    BatchSummary summary;
    const ConsoleLog& log = options.convert.log;

    const std::string out_dir = options.output_dir.empty()
                                    ? (fs::path(dir) / kDefaultBatchOutputDir)
                                          .string()
                                    : options.output_dir;

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        console_error(log, "cannot create output directory %s: %s",
                      out_dir.c_str(), ec.message().c_str());
        summary.output_dir_ok = false;
        return summary;
    }

    const std::vector<std::string> files = collect_image_files(dir, out_dir);
    summary.total = static_cast<uint32_t>(files.size());
    if (files.empty()) {
        console_summary(log, "no PNG/JPEG files found in %s", dir.c_str());
        return summary;
    }
    console_summary(log, "found %u image(s); output: %s", summary.total,
                    out_dir.c_str());

    ConvertOptions item_options = options.convert;
    if (item_options.log.verbosity > Verbosity::Summary) {
        item_options.log.verbosity = Verbosity::Summary;
    }

    OutputNameAllocator names;
    for (size_t i = 0; i < files.size(); ++i) {
        const std::string& input = files[i];
        const std::string name = names.allocate(batch_output_filename(input));
        const std::string output = (fs::path(out_dir) / name).string();

        ConvertResult r;
        try {
            r = convert_screenshot(input, output, item_options);
        } catch (const std::bad_alloc&) {
            r.status  = ConvertStatus::IoError;
            r.message = "out of memory";
        }
        if (r.ok()) {
            summary.succeeded += 1;
            console_summary(log, "[%zu/%zu] %s -> %s", i + 1, files.size(),
                            input.c_str(), name.c_str());
        } else {
            summary.failed += 1;
            console_summary(log, "[%zu/%zu] %s: FAILED (%s: %s)", i + 1,
                            files.size(), input.c_str(),
                            convert_status_name(r.status), r.message.c_str());
        }
    }

    console_summary(log, "done: %u succeeded, %u failed", summary.succeeded,
                    summary.failed);
    return summary;
}

}  // namespace pngshot
