#pragma once

#include "palette.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Pixel buffer: RGBA8, row-major, origin top-left, width*height*4 bytes.
struct PixelBuffer {
    std::vector<uint8_t> bytes;
    uint32_t width  = 0;
    uint32_t height = 0;

    void resize(uint32_t w, uint32_t h)
    {
        width  = w;
        height = h;
        bytes.assign(static_cast<size_t>(w) * h * 4, 0);
    }

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }

    void set(size_t index, RGBAColor c)
    {
        uint8_t* p = bytes.data() + index * 4;
        p[0] = c.r;
        p[1] = c.g;
        p[2] = c.b;
        p[3] = c.a;
    }

    RGBAColor at(uint32_t x, uint32_t y) const
    {
        const uint8_t* p = bytes.data() + (static_cast<size_t>(y) * width + x) * 4;
        return {p[0], p[1], p[2], p[3]};
    }
};
