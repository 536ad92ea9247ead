#include "pngshot/metadata_tool.h"

#include "test_png_util.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace pngshot {
namespace {

    static ScreenshotMetadata sample_fields()
    {
        ScreenshotMetadata fields;
        fields.datetime = "2024:03:04 05:06:07";
        return fields;
    }


    TEST(MetadataTool, TagArgumentsWithSource)
    {
        const std::vector<std::string> args = build_screenshot_tag_args(
            "in.png", true, sample_fields(), "out.png.temp1");
        const std::vector<std::string> expected = {
            "-overwrite_original",
            "-tagsFromFile",
            "in.png",
            "-all:all",
            "-unsafe",
            "-ImageDescription=Screenshot",
            "-UserComment=Screenshot",
            "-DateTimeOriginal=2024:03:04 05:06:07",
            "-ModifyDate=2024:03:04 05:06:07",
            "-CreateDate=2024:03:04 05:06:07",
            "-Orientation=1",
            "-XResolution=144",
            "-YResolution=144",
            "-ResolutionUnit=2",
            "-ColorSpace=1",
            "out.png.temp1",
        };
        EXPECT_EQ(args, expected);
    }


    TEST(MetadataTool, TagArgumentsWithoutSource)
    {
        const std::vector<std::string> args = build_screenshot_tag_args(
            "gone.png", false, sample_fields(), "t");
        ASSERT_EQ(args.size(), 12U);
        EXPECT_EQ(args[0], "-overwrite_original");
        EXPECT_EQ(args[1], "-ImageDescription=Screenshot");
        EXPECT_EQ(args.back(), "t");
        for (const std::string& a : args) {
            EXPECT_NE(a, "-tagsFromFile");
        }
    }


    TEST(MetadataTool, MissingToolIsNotFound)
    {
        TestDir dir;
        const MetadataToolResult r = write_screenshot_metadata(
            "pngshot-no-such-exiftool", "", sample_fields(), dir.file("x.png"));
        EXPECT_EQ(r.status, MetadataToolStatus::NotFound);
        EXPECT_FALSE(r.diagnostics.empty());
    }


    TEST(MetadataTool, NonZeroExitIsFailed)
    {
        const MetadataToolResult r = force_orientation_normal("false", "x.png");
        EXPECT_EQ(r.status, MetadataToolStatus::Failed);
        EXPECT_NE(r.exit_code, 0);
        EXPECT_STREQ(metadata_tool_status_name(r.status), "failed");
    }


    TEST(MetadataTool, WritesAndReadsBackWithFakeTool)
    {
        TestDir dir;
        const std::string path = dir.file("shot.png");
        ASSERT_TRUE(write_test_file(path, make_test_png({})));

        const MetadataToolResult w = write_screenshot_metadata(
            PNGSHOT_FAKE_EXIFTOOL_PATH, path, sample_fields(), path);
        ASSERT_EQ(w.status, MetadataToolStatus::Ok) << w.diagnostics;

        const MetadataToolResult r
            = read_image_description(PNGSHOT_FAKE_EXIFTOOL_PATH, path);
        ASSERT_EQ(r.status, MetadataToolStatus::Ok) << r.diagnostics;
        EXPECT_EQ(r.output, "Screenshot");
    }

}  // namespace
}  // namespace pngshot
