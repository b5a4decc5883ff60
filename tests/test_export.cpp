#include "export.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

class ExportTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir = fs::temp_directory_path() /
              (std::string("fractal_reel_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static PixelBuffer solid(uint32_t w, uint32_t h, RGBAColor c)
    {
        PixelBuffer buf;
        buf.resize(w, h);
        for (size_t i = 0; i < buf.pixel_count(); ++i) buf.set(i, c);
        return buf;
    }

    static std::vector<char> read_all(const fs::path& p)
    {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    fs::path dir;
};

} // namespace

TEST(OutputFormat, Names)
{
    OutputFormat f = OutputFormat::Png;
    EXPECT_TRUE(parse_output_format("raw", f));
    EXPECT_EQ(f, OutputFormat::Raw);
    EXPECT_TRUE(parse_output_format("PNG", f));
    EXPECT_EQ(f, OutputFormat::Png);
    EXPECT_TRUE(parse_output_format("jxl", f));
    EXPECT_EQ(f, OutputFormat::Jxl);
    EXPECT_FALSE(parse_output_format("mp4", f));
    EXPECT_EQ(f, OutputFormat::Jxl);

    EXPECT_STREQ(format_name(OutputFormat::Raw), "raw");
}

TEST_F(ExportTest, PngSequenceCreatesDirectory)
{
    const fs::path out = dir / "nested" / "frames";
    std::string err;
    auto sink = make_frame_sink(OutputFormat::Png, out.string(), 4, 3, err);
    ASSERT_TRUE(sink != nullptr) << err;

    ASSERT_EQ(sink->start(), "");
    EXPECT_TRUE(fs::is_directory(out));

    const PixelBuffer buf = solid(4, 3, {10, 20, 30, 255});
    ASSERT_EQ(sink->write_frame(buf, 0), "");
    ASSERT_EQ(sink->write_frame(buf, 12), "");
    ASSERT_EQ(sink->finish(), "");

    const std::vector<char> png = read_all(out / "frame_000000.png");
    ASSERT_GE(png.size(), 8u);
    EXPECT_EQ(png[1], 'P');
    EXPECT_EQ(png[2], 'N');
    EXPECT_EQ(png[3], 'G');
    EXPECT_TRUE(fs::exists(out / "frame_000012.png"));
}

TEST_F(ExportTest, WrongFrameSizeIsAnError)
{
    std::string err;
    auto sink = make_frame_sink(OutputFormat::Png, dir.string(), 4, 3, err);
    ASSERT_TRUE(sink != nullptr);
    ASSERT_EQ(sink->start(), "");
    EXPECT_NE(sink->write_frame(solid(3, 4, {}), 0), "");
}

TEST_F(ExportTest, RawStreamConcatenatesFrames)
{
    const fs::path out = dir / "video.rgba";
    std::string err;
    auto sink = make_frame_sink(OutputFormat::Raw, out.string(), 2, 2, err);
    ASSERT_TRUE(sink != nullptr) << err;

    ASSERT_EQ(sink->start(), "");
    ASSERT_EQ(sink->write_frame(solid(2, 2, {1, 2, 3, 4}), 0), "");
    ASSERT_EQ(sink->write_frame(solid(2, 2, {5, 6, 7, 8}), 1), "");
    ASSERT_EQ(sink->finish(), "");

    const std::vector<char> bytes = read_all(out);
    ASSERT_EQ(bytes.size(), 2u * 2 * 2 * 4);
    EXPECT_EQ(bytes[0], 1);
    EXPECT_EQ(bytes[3], 4);
    EXPECT_EQ(bytes[16], 5);
    EXPECT_EQ(bytes[31], 8);
}

TEST_F(ExportTest, RawStreamNeedsStart)
{
    std::string err;
    auto sink = make_frame_sink(OutputFormat::Raw, (dir / "x.rgba").string(), 2, 2, err);
    ASSERT_TRUE(sink != nullptr);
    EXPECT_NE(sink->write_frame(solid(2, 2, {}), 0), "");
}

TEST_F(ExportTest, UnwritablePngPath)
{
    const PixelBuffer buf = solid(2, 2, {});
    EXPECT_NE(export_png((dir / "missing" / "a.png").string().c_str(), buf), "");
}

TEST_F(ExportTest, JxlSink)
{
    std::string err;
    auto sink = make_frame_sink(OutputFormat::Jxl, dir.string(), 2, 2, err);
    if (!jxl_available()) {
        EXPECT_TRUE(sink == nullptr);
        EXPECT_FALSE(err.empty());
        return;
    }
    ASSERT_TRUE(sink != nullptr) << err;
    ASSERT_EQ(sink->start(), "");
    ASSERT_EQ(sink->write_frame(solid(2, 2, {9, 9, 9, 255}), 0), "");
    ASSERT_EQ(sink->finish(), "");
    EXPECT_TRUE(fs::exists(dir / "frame_000000.jxl"));
}
