#include "overlay.hpp"

void draw_horizontal_line(PixelBuffer& buf, uint32_t y, RGBAColor color)
{
    if (y >= buf.height) return;
    const size_t row = static_cast<size_t>(y) * buf.width;
    for (uint32_t x = 0; x < buf.width; ++x)
        buf.set(row + x, color);
}

void draw_vertical_line(PixelBuffer& buf, uint32_t x, RGBAColor color)
{
    if (x >= buf.width) return;
    for (uint32_t y = 0; y < buf.height; ++y)
        buf.set(static_cast<size_t>(y) * buf.width + x, color);
}

void draw_constrained_crosshair(PixelBuffer& buf, const PixelCoords& at,
                                RGBAColor color)
{
    if (at.y.in_range())
        draw_horizontal_line(buf, at.y.value, color);
    if (at.x.in_range())
        draw_vertical_line(buf, at.x.value, color);
}
