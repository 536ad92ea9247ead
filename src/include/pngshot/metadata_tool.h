#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * \file metadata_tool.h
 * \brief exiftool invocations used by the screenshot conversion.
 */

namespace pngshot {

/// Tag values written into every converted screenshot.
struct ScreenshotMetadata final {
    /// `YYYY:MM:DD HH:MM:SS`; written to DateTimeOriginal/ModifyDate/CreateDate.
    std::string datetime;
    /// Written to ImageDescription and UserComment.
    std::string description = "Screenshot";

    uint32_t orientation     = 1;    // horizontal (normal)
    uint32_t x_resolution    = 144;
    uint32_t y_resolution    = 144;
    uint32_t resolution_unit = 2;    // inches
    uint32_t color_space     = 1;    // sRGB
};

enum class MetadataToolStatus : uint8_t {
    Ok,
    /// The tool is not on `PATH`.
    NotFound,
    /// The tool ran and exited non-zero (or died from a signal).
    Failed,
    /// The process could not be started or waited for.
    SpawnFailed,
};

const char*
metadata_tool_status_name(MetadataToolStatus status) noexcept;

struct MetadataToolResult final {
    MetadataToolStatus status = MetadataToolStatus::Ok;
    int exit_code             = -1;
    /// Captured stderr (diagnostics), or a spawn error description.
    std::string diagnostics;
    std::string output;
};

/**
 * \brief Builds the argument list that copies tags from \p source_path and
 * overwrites the screenshot fields in \p target_path.
 *
 * The `-tagsFromFile <source> -all:all -unsafe` group is included only when
 * \p include_source_tags is true. The returned list excludes the program name.
 */
std::vector<std::string>
build_screenshot_tag_args(const std::string& source_path,
                          bool include_source_tags,
                          const ScreenshotMetadata& fields,
                          const std::string& target_path);

/// Runs \p tool with the arguments of \ref build_screenshot_tag_args.
MetadataToolResult
write_screenshot_metadata(const std::string& tool,
                          const std::string& source_path,
                          const ScreenshotMetadata& fields,
                          const std::string& target_path);

/**
 * \brief Rewrites Orientation as the numeric value 1 in \p path.
 *
 * exiftool does not always end up with a numeric normal orientation after a
 * tag copy; writing it again with `-n` pins it.
 */
MetadataToolResult
force_orientation_normal(const std::string& tool, const std::string& path);

/// Reads ImageDescription via `-s3`; the value lands in `output`, trimmed.
MetadataToolResult
read_image_description(const std::string& tool, const std::string& path);

}  // namespace pngshot
