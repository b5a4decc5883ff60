#include "view.hpp"

#include <gtest/gtest.h>

TEST(View, NewUniformCentersThePlane)
{
    const View v = View::new_uniform(4, 4, 4.0);
    EXPECT_DOUBLE_EQ(v.scale_x, 1.0);
    EXPECT_DOUBLE_EQ(v.scale_y, 1.0);
    EXPECT_DOUBLE_EQ(v.plane_origin_x, -2.0);
    EXPECT_DOUBLE_EQ(v.plane_origin_y, -2.0);

    const auto p = v.plane_of(0, 0);
    EXPECT_DOUBLE_EQ(p.real(), -2.0);
    EXPECT_DOUBLE_EQ(p.imag(), -2.0);
}

TEST(View, NonSquareImageKeepsSquarePixels)
{
    const View v = View::new_uniform(300, 200, 3.0);
    EXPECT_DOUBLE_EQ(v.scale_x, 0.01);
    EXPECT_DOUBLE_EQ(v.scale_y, 0.01);
    EXPECT_DOUBLE_EQ(v.plane_origin_x, -1.5);
    EXPECT_DOUBLE_EQ(v.plane_origin_y, -1.0);
    EXPECT_EQ(v.pixel_count(), 60000u);
}

TEST(View, PixelRoundTrip)
{
    for (const View& v : {View::new_uniform(64, 48, 3.0),
                          View::new_uniform(300, 200, 3.7),
                          View::new_uniform(33, 77, 0.001)}) {
        for (uint32_t y = 1; y < v.image_height; ++y) {
            for (uint32_t x = 1; x < v.image_width; ++x) {
                const PixelCoords c = v.pixel_of(v.plane_of(x, y));
                ASSERT_EQ(c.x, ConstrainedCoord::within(x)) << x << "," << y;
                ASSERT_EQ(c.y, ConstrainedCoord::within(y)) << x << "," << y;
            }
        }
    }
}

// The lower bound is exclusive: the origin itself is outside the image.
TEST(View, OriginIsBelowRange)
{
    const View v = View::new_uniform(4, 4, 4.0);
    const PixelCoords c = v.pixel_of(v.plane_of(0, 0));
    EXPECT_EQ(c.x.range, ConstrainedCoord::Range::Below);
    EXPECT_EQ(c.y.range, ConstrainedCoord::Range::Below);

    const PixelCoords left = v.pixel_of({-5.0, 0.5});
    EXPECT_EQ(left.x, ConstrainedCoord::below());
    EXPECT_EQ(left.y, ConstrainedCoord::within(2));
}

TEST(View, JustInsideOriginIsPixelZero)
{
    const View v = View::new_uniform(4, 4, 4.0);
    const PixelCoords c = v.pixel_of({-1.5, -1.999});
    EXPECT_EQ(c.x, ConstrainedCoord::within(0));
    EXPECT_EQ(c.y, ConstrainedCoord::within(0));
}

TEST(View, AboveRangeAtTheFarEdge)
{
    const View v = View::new_uniform(4, 4, 4.0);

    // index == dimension
    PixelCoords c = v.pixel_of({2.0, 2.0});
    EXPECT_EQ(c.x, ConstrainedCoord::above());
    EXPECT_EQ(c.y, ConstrainedCoord::above());

    c = v.pixel_of({1.75, 10.0});
    EXPECT_EQ(c.x, ConstrainedCoord::within(3));
    EXPECT_EQ(c.y, ConstrainedCoord::above());

    // Just short of the far edge is still the last pixel.
    c = v.pixel_of({1.9999999995, 1.9999999995});
    EXPECT_EQ(c.x, ConstrainedCoord::within(3));
    EXPECT_EQ(c.y, ConstrainedCoord::within(3));
}

TEST(View, AxesAreIndependent)
{
    const View v = View::new_uniform(10, 10, 10.0);
    const PixelCoords c = v.pixel_of({100.0, -100.0});
    EXPECT_EQ(c.x, ConstrainedCoord::above());
    EXPECT_EQ(c.y, ConstrainedCoord::below());
    EXPECT_FALSE(c.x.in_range());
    EXPECT_FALSE(c.y.in_range());
}
