#pragma once

#include "renderer.hpp"

#include <cstdint>
#include <memory>
#include <string>

// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}

// Destination of the finished animation frames. Every call returns an empty
// string on success or an error message; after an error the sink must not
// be used again.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual std::string start() = 0;
    // buf must be exactly the size the sink was created for. pts counts
    // frames in units of the video time base.
    virtual std::string write_frame(const PixelBuffer& buf, int64_t pts) = 0;
    virtual std::string finish() = 0;
};

enum class OutputFormat {
    Png = 0,  // directory of frame_NNNNNN.png
    Raw = 1,  // concatenated RGBA8 frames, "-" for stdout
    Jxl = 2,  // directory of frame_NNNNNN.jxl (HAVE_JXL builds only)
};

const char* format_name(OutputFormat f);

// Returns false for unknown names.
bool parse_output_format(const std::string& name, OutputFormat& out);

// Returns nullptr and fills error when the format is not available.
std::unique_ptr<FrameSink> make_frame_sink(OutputFormat format,
                                           const std::string& output,
                                           uint32_t width, uint32_t height,
                                           std::string& error);
