#include "export.hpp"

#include <png.h>
#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/encode_cxx.h>
#include <jxl/color_encoding.h>
#include <algorithm>
#include <vector>
#endif

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// PNG export
//
// PixelBuffer bytes are already [R, G, B, A] per pixel, row-major, which is
// exactly what PNG_COLOR_TYPE_RGBA expects.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf)
{
    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return std::string("PNG write error (libpng longjmp): ") + path;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    const size_t stride = static_cast<size_t>(buf.width) * 4;
    for (uint32_t y = 0; y < buf.height; ++y)
        png_write_row(png, buf.bytes.data() + y * stride);

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing ") + path + ": " + std::strerror(errno);
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGBA, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
namespace {

// Compresses buf into out. Returns the name of the failing call, or empty.
std::string encode_jxl(const PixelBuffer& buf, std::vector<uint8_t>& out)
{
    JxlEncoderPtr enc = JxlEncoderMake(nullptr);
    if (!enc) return "JxlEncoderCreate";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                 = buf.width;
    bi.ysize                 = buf.height;
    bi.bits_per_sample       = 8;
    bi.alpha_bits            = 8;
    bi.num_color_channels    = 3;
    bi.num_extra_channels    = 1;
    bi.uses_original_profile = JXL_TRUE;
    if (JxlEncoderSetBasicInfo(enc.get(), &bi) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetBasicInfo";

    JxlExtraChannelInfo alpha;
    JxlEncoderInitExtraChannelInfo(JXL_CHANNEL_ALPHA, &alpha);
    alpha.bits_per_sample = 8;
    if (JxlEncoderSetExtraChannelInfo(enc.get(), 0, &alpha) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetExtraChannelInfo";

    JxlColorEncoding srgb;
    JxlColorEncodingSetToSRGB(&srgb, JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc.get(), &srgb) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetColorEncoding";

    JxlEncoderFrameSettings* frame = JxlEncoderFrameSettingsCreate(enc.get(), nullptr);
    if (JxlEncoderSetFrameLossless(frame, JXL_TRUE) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetFrameLossless";

    const JxlPixelFormat rgba8 = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(frame, &rgba8, buf.bytes.data(), buf.bytes.size())
            != JXL_ENC_SUCCESS)
        return "JxlEncoderAddImageFrame";
    JxlEncoderCloseInput(enc.get());

    // Lossless output is rarely larger than the raw pixels.
    out.resize(std::max<size_t>(buf.bytes.size() / 2, 4096));
    size_t used = 0;
    for (;;) {
        uint8_t* next  = out.data() + used;
        size_t   avail = out.size() - used;
        const JxlEncoderStatus st = JxlEncoderProcessOutput(enc.get(), &next, &avail);
        used = static_cast<size_t>(next - out.data());
        if (st == JXL_ENC_SUCCESS) break;
        if (st != JXL_ENC_NEED_MORE_OUTPUT) return "JxlEncoderProcessOutput";
        out.resize(out.size() * 2);
    }
    out.resize(used);
    return {};
}

} // namespace

std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    std::vector<uint8_t> encoded;
    const std::string failed = encode_jxl(buf, encoded);
    if (!failed.empty())
        return failed + " failed for " + path;

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path + ": " + std::strerror(errno);
    const size_t n = std::fwrite(encoded.data(), 1, encoded.size(), fp);
    if (std::fclose(fp) != 0 || n != encoded.size())
        return std::string("Error writing ") + path;
    return {};  // success
}
#endif  // HAVE_JXL

// ---------------------------------------------------------------------------
// Frame sinks
// ---------------------------------------------------------------------------
namespace {

std::string check_frame(const PixelBuffer& buf, uint32_t width, uint32_t height)
{
    if (buf.width != width || buf.height != height ||
        buf.bytes.size() != static_cast<size_t>(width) * height * 4) {
        char msg[128];
        std::snprintf(msg, sizeof(msg), "frame is %ux%u, expected %ux%u",
                      buf.width, buf.height, width, height);
        return msg;
    }
    return {};
}

std::string make_directories(const fs::path& dir)
{
    if (dir.empty()) return {};
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        return "Cannot create directory " + dir.string() + ": " + ec.message();
    return {};
}

// One image file per frame, named after the frame's pts.
class ImageSequenceSink : public FrameSink {
public:
    using Writer = std::string (*)(const char*, const PixelBuffer&);

    ImageSequenceSink(std::string directory, const char* extension, Writer writer,
                      uint32_t width, uint32_t height)
        : dir(std::move(directory)), ext(extension), writer(writer),
          width(width), height(height) {}

    std::string start() override { return make_directories(dir); }

    std::string write_frame(const PixelBuffer& buf, int64_t pts) override
    {
        std::string err = check_frame(buf, width, height);
        if (!err.empty()) return err;

        char name[64];
        std::snprintf(name, sizeof(name), "frame_%06" PRId64 ".%s", pts, ext);
        return writer((dir / name).string().c_str(), buf);
    }

    std::string finish() override { return {}; }

private:
    fs::path    dir;
    const char* ext;
    Writer      writer;
    uint32_t    width;
    uint32_t    height;
};

// Headerless RGBA8 stream, e.g. for `ffmpeg -f rawvideo -pix_fmt rgba`.
class RawVideoSink : public FrameSink {
public:
    RawVideoSink(std::string output, uint32_t width, uint32_t height)
        : path(std::move(output)), width(width), height(height) {}

    ~RawVideoSink() override
    {
        if (fp && fp != stdout) std::fclose(fp);
    }

    std::string start() override
    {
        if (path == "-") {
            fp = stdout;
            return {};
        }
        std::string err = make_directories(fs::path(path).parent_path());
        if (!err.empty()) return err;
        fp = std::fopen(path.c_str(), "wb");
        if (!fp)
            return "Cannot open file for writing: " + path + ": " + std::strerror(errno);
        return {};
    }

    std::string write_frame(const PixelBuffer& buf, int64_t) override
    {
        if (!fp) return "raw video output is not open";
        std::string err = check_frame(buf, width, height);
        if (!err.empty()) return err;
        if (std::fwrite(buf.bytes.data(), 1, buf.bytes.size(), fp) != buf.bytes.size())
            return "Error writing " + path + ": " + std::strerror(errno);
        return {};
    }

    std::string finish() override
    {
        if (!fp) return "raw video output is not open";
        FILE* f = fp;
        fp = nullptr;
        if (f == stdout)
            return std::fflush(f) == 0 ? std::string() : "Error flushing stdout";
        if (std::fclose(f) != 0)
            return "Error closing " + path + ": " + std::strerror(errno);
        return {};
    }

private:
    std::string path;
    uint32_t    width;
    uint32_t    height;
    FILE*       fp = nullptr;
};

} // namespace

const char* format_name(OutputFormat f)
{
    switch (f) {
        case OutputFormat::Png: return "png";
        case OutputFormat::Raw: return "raw";
        case OutputFormat::Jxl: return "jxl";
    }
    return "unknown";
}

bool parse_output_format(const std::string& name, OutputFormat& out)
{
    std::string n;
    for (char c : name)
        n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n == "png") { out = OutputFormat::Png; return true; }
    if (n == "raw") { out = OutputFormat::Raw; return true; }
    if (n == "jxl") { out = OutputFormat::Jxl; return true; }
    return false;
}

std::unique_ptr<FrameSink> make_frame_sink(OutputFormat format,
                                           const std::string& output,
                                           uint32_t width, uint32_t height,
                                           std::string& error)
{
    switch (format) {
        case OutputFormat::Png:
            return std::make_unique<ImageSequenceSink>(output, "png", export_png,
                                                       width, height);
        case OutputFormat::Raw:
            return std::make_unique<RawVideoSink>(output, width, height);
        case OutputFormat::Jxl:
#ifdef HAVE_JXL
            return std::make_unique<ImageSequenceSink>(output, "jxl", export_jxl,
                                                       width, height);
#else
            error = "this build has no JPEG XL support";
            return nullptr;
#endif
    }
    error = "unknown output format";
    return nullptr;
}
