#include "pngshot/metadata_tool.h"

#include "pngshot/console_format.h"
#include "pngshot/file_io.h"
#include "pngshot/subprocess.h"

#include <cstring>
#include <string_view>
#include <utility>

namespace pngshot {
namespace {

    static std::string tag_arg(const char* name, std::string_view value)
    {
        std::string out("-");
        out.append(name);
        out.push_back('=');
        out.append(value.data(), value.size());
        return out;
    }


    static std::string tag_arg(const char* name, uint32_t value)
    {
        return tag_arg(name, std::to_string(value));
    }


    static MetadataToolResult run_tool(const std::string& tool,
                                       std::vector<std::string> args)
    {
        ProcessOptions options;
        options.executable = tool;
        options.args       = std::move(args);

        const ProcessResult proc = run_process(options);

        MetadataToolResult result;
        result.exit_code = proc.exit_code;
        switch (proc.status) {
        case ProcessStatus::Ok:
            result.status = (proc.exit_code == 0) ? MetadataToolStatus::Ok
                                                  : MetadataToolStatus::Failed;
            break;
        case ProcessStatus::Signaled:
            result.status = MetadataToolStatus::Failed;
            break;
        case ProcessStatus::NotFound:
            result.status = MetadataToolStatus::NotFound;
            break;
        case ProcessStatus::SpawnFailed:
        case ProcessStatus::WaitFailed:
            result.status = MetadataToolStatus::SpawnFailed;
            break;
        }

        if (proc.status == ProcessStatus::Ok
            || proc.status == ProcessStatus::Signaled) {
            result.diagnostics = std::string(
                trim_trailing_space(proc.stderr_text));
            result.output = std::string(trim_trailing_space(proc.stdout_text));
        } else {
            result.diagnostics = process_status_name(proc.status);
            if (proc.error_number != 0) {
                result.diagnostics.append(": ");
                result.diagnostics.append(std::strerror(proc.error_number));
            }
        }
        return result;
    }

}  // namespace

const char*
metadata_tool_status_name(MetadataToolStatus status) noexcept
{
    switch (status) {
    case MetadataToolStatus::Ok: return "ok";
    case MetadataToolStatus::NotFound: return "not_found";
    case MetadataToolStatus::Failed: return "failed";
    case MetadataToolStatus::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}


std::vector<std::string>
build_screenshot_tag_args(const std::string& source_path,
                          bool include_source_tags,
                          const ScreenshotMetadata& fields,
                          const std::string& target_path)
{
    std::vector<std::string> args;
    args.reserve(20);
    args.emplace_back("-overwrite_original");
    if (include_source_tags) {
        args.emplace_back("-tagsFromFile");
        args.push_back(source_path);
        args.emplace_back("-all:all");
        args.emplace_back("-unsafe");
    }
    args.push_back(tag_arg("ImageDescription", fields.description));
    args.push_back(tag_arg("UserComment", fields.description));
    args.push_back(tag_arg("DateTimeOriginal", fields.datetime));
    args.push_back(tag_arg("ModifyDate", fields.datetime));
    args.push_back(tag_arg("CreateDate", fields.datetime));
    args.push_back(tag_arg("Orientation", fields.orientation));
    args.push_back(tag_arg("XResolution", fields.x_resolution));
    args.push_back(tag_arg("YResolution", fields.y_resolution));
    args.push_back(tag_arg("ResolutionUnit", fields.resolution_unit));
    args.push_back(tag_arg("ColorSpace", fields.color_space));
    args.push_back(target_path);
    return args;
}


MetadataToolResult
write_screenshot_metadata(const std::string& tool,
                          const std::string& source_path,
                          const ScreenshotMetadata& fields,
                          const std::string& target_path)
{
    const bool have_source = !source_path.empty()
                             && file_exists(source_path.c_str());
    return run_tool(tool, build_screenshot_tag_args(source_path, have_source,
                                                    fields, target_path));
}


MetadataToolResult
force_orientation_normal(const std::string& tool, const std::string& path)
{
    return run_tool(tool, { "-Orientation=1", "-n", "-overwrite_original",
                            path });
}


MetadataToolResult
read_image_description(const std::string& tool, const std::string& path)
{
    return run_tool(tool, { "-s3", "-ImageDescription", path });
}

}  // namespace pngshot
