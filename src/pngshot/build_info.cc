#include "pngshot/build_info.h"

#include "pngshot/build_info_generated.h"

#include <string>

namespace pngshot {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/PNGSHOT_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/PNGSHOT_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/PNGSHOT_BUILDINFO_BUILD_TYPE,
        /*system_name=*/PNGSHOT_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/PNGSHOT_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/PNGSHOT_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/PNGSHOT_BUILDINFO_CXX_COMPILER_VERSION,
        /*zlib_version=*/PNGSHOT_BUILDINFO_ZLIB_VERSION,
        /*jpeg_version=*/PNGSHOT_BUILDINFO_JPEG_VERSION,
        /*png_version=*/PNGSHOT_BUILDINFO_PNG_VERSION,
    };


    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        if (!out) {
            return;
        }
        out->append(s.data(), s.size());
    }


    static void append_feature(std::string* out, bool* first,
                               std::string_view name,
                               std::string_view version) noexcept
    {
        if (!*first) {
            out->append(",");
        }
        *first = false;
        append_sv(out, name);
        if (!version.empty()) {
            out->append(" ");
            append_sv(out, version);
        }
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("pngshot v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [");
        bool first = true;
        append_feature(line1, &first, "zlib", bi.zlib_version);
        append_feature(line1, &first, "libjpeg", bi.jpeg_version);
        append_feature(line1, &first, "libpng", bi.png_version);
        line1->append("]");
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace pngshot
