#include "overlay.hpp"

#include <gtest/gtest.h>

namespace {

constexpr RGBAColor RED = {255, 0, 0, 255};

PixelBuffer blank(uint32_t w, uint32_t h)
{
    PixelBuffer buf;
    buf.resize(w, h);
    return buf;
}

int count_of(const PixelBuffer& buf, RGBAColor c)
{
    int n = 0;
    for (uint32_t y = 0; y < buf.height; ++y)
        for (uint32_t x = 0; x < buf.width; ++x)
            n += buf.at(x, y) == c;
    return n;
}

} // namespace

TEST(Overlay, CrosshairThroughPixel)
{
    PixelBuffer buf = blank(5, 4);
    draw_constrained_crosshair(buf, {ConstrainedCoord::within(1), ConstrainedCoord::within(2)});

    EXPECT_EQ(count_of(buf, CROSSHAIR_COLOR), 5 + 4 - 1);
    for (uint32_t x = 0; x < 5; ++x) EXPECT_EQ(buf.at(x, 2), CROSSHAIR_COLOR);
    for (uint32_t y = 0; y < 4; ++y) EXPECT_EQ(buf.at(1, y), CROSSHAIR_COLOR);
    EXPECT_NE(buf.at(0, 0), CROSSHAIR_COLOR);
}

TEST(Overlay, OutOfRangeAxisIsSkipped)
{
    PixelBuffer buf = blank(5, 4);
    draw_constrained_crosshair(buf, {ConstrainedCoord::below(), ConstrainedCoord::within(3)}, RED);
    EXPECT_EQ(count_of(buf, RED), 5);

    buf = blank(5, 4);
    draw_constrained_crosshair(buf, {ConstrainedCoord::within(4), ConstrainedCoord::above()}, RED);
    EXPECT_EQ(count_of(buf, RED), 4);

    buf = blank(5, 4);
    draw_constrained_crosshair(buf, {ConstrainedCoord::above(), ConstrainedCoord::below()}, RED);
    EXPECT_EQ(count_of(buf, RED), 0);
}

TEST(Overlay, LinesOutsideTheBufferAreIgnored)
{
    PixelBuffer buf = blank(3, 3);
    draw_horizontal_line(buf, 3, RED);
    draw_vertical_line(buf, 7, RED);
    EXPECT_EQ(count_of(buf, RED), 0);
}
