#include "pngshot/convert.h"

#include "pngshot/exif_datetime.h"
#include "pngshot/file_io.h"
#include "pngshot/png_chunk.h"
#include "test_png_util.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace pngshot {
namespace {

    static constexpr uint32_t kText = fourcc('t', 'E', 'X', 't');

    class ScopedEnv final {
    public:
        ScopedEnv(const char* name, const std::string& value)
            : name_(name)
        {
            ::setenv(name, value.c_str(), 1);
        }
        ~ScopedEnv() { ::unsetenv(name_); }

        ScopedEnv(const ScopedEnv&)            = delete;
        ScopedEnv& operator=(const ScopedEnv&) = delete;

    private:
        const char* name_;
    };


    static ConvertOptions test_options()
    {
        ConvertOptions options;
        options.metadata_tool = PNGSHOT_FAKE_EXIFTOOL_PATH;
        return options;
    }


    static std::vector<std::string> dir_entries(const TestDir& dir)
    {
        std::vector<std::string> names;
        for (const auto& e : std::filesystem::directory_iterator(dir.path())) {
            names.push_back(e.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }


    static std::vector<std::string> read_lines(const std::string& path)
    {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }


    // Out-of-order PNG with a stale pHYs and an early text chunk.
    static std::vector<std::byte> make_android_png()
    {
        std::vector<std::byte> png;
        append_png_signature(&png);
        append_test_chunk(&png, kPngIhdr, make_ihdr_payload(2, 2));
        append_test_chunk(&png, kPngPhys, bytes_of("123456789"));
        append_test_chunk(&png, kText, bytes_of("Software\x01test"));
        append_test_chunk(&png, kPngIdat, bytes_of("pixel-data"));
        append_test_chunk(&png, kPngIend, {});
        return png;
    }


    TEST(Convert, DefaultOutputPath)
    {
        EXPECT_EQ(default_output_path("shot.png"), "shot_ios.png");
        EXPECT_EQ(default_output_path("/a/b/Screen.JPEG"), "/a/b/Screen_ios.png");
        EXPECT_EQ(default_output_path("/a.dir/noext"), "/a.dir/noext_ios.png");
        EXPECT_EQ(default_output_path(".hidden"), ".hidden_ios.png");
    }


    TEST(Convert, PngProducesScreenshotChunkOrder)
    {
        TestDir dir;
        const std::string input = dir.file("shot.png");
        ASSERT_TRUE(write_test_file(input, make_android_png()));

        const ConvertResult r = convert_screenshot(input, "", test_options());
        ASSERT_TRUE(r.ok()) << convert_status_name(r.status) << ": "
                            << r.message;
        EXPECT_EQ(r.output_path, dir.file("shot_ios.png"));

        std::vector<std::byte> out;
        ASSERT_EQ(read_file_bytes(r.output_path.c_str(), 0, &out),
                  FileIoStatus::Ok);
        const std::vector<uint32_t> expected = { kPngIhdr, kPngSrgb, kText,
                                                 kPngExif, kPngPhys, kPngSbit,
                                                 kPngIdat, kPngIend };
        EXPECT_EQ(png_chunk_types(out), expected);

        std::vector<PngChunk> chunks;
        ASSERT_EQ(decode_png_chunks(out, &chunks), PngChunkStatus::Ok);
        // The stale pHYs was replaced by the 144 dpi default.
        ASSERT_EQ(chunks[4].data.size(), 9U);
        EXPECT_EQ(chunks[4].data[3], std::byte { 0x25 });
        EXPECT_EQ(chunks[6].data.size(), 10U);

        const std::vector<std::string> names = { "shot.png", "shot_ios.png" };
        EXPECT_EQ(dir_entries(dir), names);
    }


    TEST(Convert, JpegKeepsCaptureTime)
    {
        TestDir dir;
        const std::string input  = dir.file("photo.jpg");
        const std::string output = dir.file("photo_out.png");
        ASSERT_TRUE(write_test_file(
            input,
            make_test_jpeg(8, 4, make_exif_tiff_le("2018:07:08 09:10:11"))));

        const ConvertResult r = convert_screenshot(input, output,
                                                   test_options());
        ASSERT_TRUE(r.ok()) << r.message;

        std::vector<std::byte> out;
        ASSERT_EQ(read_file_bytes(output.c_str(), 0, &out), FileIoStatus::Ok);
        const std::vector<uint32_t> types = png_chunk_types(out);
        ASSERT_GE(types.size(), 7U);
        EXPECT_EQ(types[0], kPngIhdr);
        EXPECT_EQ(types[1], kPngSrgb);
        EXPECT_EQ(types[2], kPngExif);
        EXPECT_EQ(types[3], kPngPhys);
        EXPECT_EQ(types[4], kPngSbit);
        EXPECT_EQ(types[5], kPngIdat);
        EXPECT_EQ(types.back(), kPngIend);

        std::string dt;
        ASSERT_TRUE(find_exif_datetime_original(find_exif_tiff(out), &dt));
        EXPECT_EQ(dt, "2018:07:08 09:10:11");

        EXPECT_FALSE(file_exists((output + ".temp_png").c_str()));
        EXPECT_FALSE(file_exists((output + ".temp1").c_str()));
    }


    TEST(Convert, RestoresModificationTime)
    {
        TestDir dir;
        const std::string input = dir.file("shot.png");
        ASSERT_TRUE(write_test_file(input, make_android_png()));
        FileTime t;
        t.seconds = 1500000000;
        ASSERT_EQ(set_file_mtime(input.c_str(), t), FileIoStatus::Ok);

        const ConvertResult r = convert_screenshot(input, "", test_options());
        ASSERT_TRUE(r.ok()) << r.message;

        FileTime out_time;
        ASSERT_EQ(read_file_mtime(r.output_path.c_str(), &out_time),
                  FileIoStatus::Ok);
        EXPECT_EQ(out_time.seconds, 1500000000);

        std::string expected;
        ASSERT_TRUE(format_exif_datetime(1500000000, &expected));
        std::vector<std::byte> out;
        ASSERT_EQ(read_file_bytes(r.output_path.c_str(), 0, &out),
                  FileIoStatus::Ok);
        std::string dt;
        ASSERT_TRUE(find_exif_datetime_original(find_exif_tiff(out), &dt));
        EXPECT_EQ(dt, expected);
    }


    TEST(Convert, InvokesToolInOrder)
    {
        TestDir dir;
        const std::string input = dir.file("shot.png");
        const std::string log   = dir.file("tool.log");
        ASSERT_TRUE(write_test_file(input, make_android_png()));

        ScopedEnv env("PNGSHOT_FAKE_EXIFTOOL_LOG", log);
        const ConvertResult r = convert_screenshot(input, "", test_options());
        ASSERT_TRUE(r.ok()) << r.message;

        const std::vector<std::string> lines = read_lines(log);
        ASSERT_EQ(lines.size(), 3U);
        const std::string write_prefix = "-overwrite_original -tagsFromFile "
                                         + input
                                         + " -all:all -unsafe "
                                           "-ImageDescription=Screenshot ";
        EXPECT_EQ(lines[0].rfind(write_prefix, 0), 0U) << lines[0];
        EXPECT_NE(lines[0].find(" " + r.output_path + ".temp1"),
                  std::string::npos);
        EXPECT_EQ(lines[1], "-Orientation=1 -n -overwrite_original "
                                + r.output_path);
        EXPECT_EQ(lines[2], "-s3 -ImageDescription " + r.output_path);
    }


    TEST(Convert, QuietSkipsVerification)
    {
        TestDir dir;
        const std::string input = dir.file("shot.png");
        const std::string log   = dir.file("tool.log");
        ASSERT_TRUE(write_test_file(input, make_android_png()));

        ScopedEnv env("PNGSHOT_FAKE_EXIFTOOL_LOG", log);
        ConvertOptions options = test_options();
        options.log.verbosity  = Verbosity::Summary;
        ASSERT_TRUE(convert_screenshot(input, "", options).ok());
        EXPECT_EQ(read_lines(log).size(), 2U);
    }


    TEST(Convert, MissingToolLeavesNothing)
    {
        TestDir dir;
        const std::string input = dir.file("shot.png");
        ASSERT_TRUE(write_test_file(input, make_android_png()));

        ConvertOptions options = test_options();
        options.metadata_tool  = "pngshot-no-such-exiftool";
        options.log.verbosity  = Verbosity::Quiet;
        const ConvertResult r  = convert_screenshot(input, "", options);
        EXPECT_EQ(r.status, ConvertStatus::MetadataToolNotFound);

        const std::vector<std::string> names = { "shot.png" };
        EXPECT_EQ(dir_entries(dir), names);
    }


    TEST(Convert, FailingToolLeavesNothing)
    {
        TestDir dir;
        const std::string input = dir.file("photo.jpeg");
        ASSERT_TRUE(write_test_file(input, make_test_jpeg(4, 4, {})));

        ScopedEnv env("PNGSHOT_FAKE_EXIFTOOL_FAIL", "1");
        ConvertOptions options = test_options();
        options.log.verbosity  = Verbosity::Quiet;
        const ConvertResult r  = convert_screenshot(input, "", options);
        EXPECT_EQ(r.status, ConvertStatus::MetadataToolFailed);
        EXPECT_NE(r.message.find("simulated failure"), std::string::npos)
            << r.message;

        const std::vector<std::string> names = { "photo.jpeg" };
        EXPECT_EQ(dir_entries(dir), names);
    }


    TEST(Convert, RejectsBadInput)
    {
        TestDir dir;
        ConvertOptions options = test_options();
        options.log.verbosity  = Verbosity::Quiet;

        const std::string gif = dir.file("anim.gif");
        ASSERT_TRUE(write_test_file(gif, bytes_of("GIF89a not really")));
        EXPECT_EQ(convert_screenshot(gif, "", options).status,
                  ConvertStatus::FormatError);

        std::vector<std::byte> truncated = make_android_png();
        truncated.resize(truncated.size() - 20);
        const std::string cut = dir.file("cut.png");
        ASSERT_TRUE(write_test_file(cut, truncated));
        EXPECT_EQ(convert_screenshot(cut, "", options).status,
                  ConvertStatus::FormatError);

        EXPECT_EQ(convert_screenshot(dir.file("missing.png"), "", options)
                      .status,
                  ConvertStatus::IoError);

        std::vector<std::byte> forged = make_test_jpeg(16, 8, {});
        ASSERT_TRUE(patch_jpeg_dimensions(&forged, 65000, 65000));
        const std::string huge = dir.file("huge.jpg");
        ASSERT_TRUE(write_test_file(huge, forged));
        const ConvertResult hr = convert_screenshot(huge, "", options);
        EXPECT_EQ(hr.status, ConvertStatus::FormatError);
        EXPECT_NE(hr.message.find("limit_exceeded"), std::string::npos)
            << hr.message;

        options.max_input_bytes = 16;
        const std::string big   = dir.file("big.png");
        ASSERT_TRUE(write_test_file(big, make_android_png()));
        EXPECT_EQ(convert_screenshot(big, "", options).status,
                  ConvertStatus::IoError);

        const std::vector<std::string> names = { "anim.gif", "big.png",
                                                 "cut.png", "huge.jpg" };
        EXPECT_EQ(dir_entries(dir), names);
    }

}  // namespace
}  // namespace pngshot
