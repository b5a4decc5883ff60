#pragma once

#include <algorithm>
#include <complex>
#include <cstdint>

// Result of mapping one plane axis back onto the image.
struct ConstrainedCoord {
    enum class Range { Below, Within, Above };

    Range    range = Range::Below;
    uint32_t value = 0;   // valid only when range == Within

    static ConstrainedCoord below()            { return {Range::Below, 0}; }
    static ConstrainedCoord within(uint32_t v) { return {Range::Within, v}; }
    static ConstrainedCoord above()            { return {Range::Above, 0}; }

    bool in_range() const { return range == Range::Within; }

    bool operator==(const ConstrainedCoord& o) const
    {
        return range == o.range && (range != Range::Within || value == o.value);
    }
    bool operator!=(const ConstrainedCoord& o) const { return !(*this == o); }
};

struct PixelCoords {
    ConstrainedCoord x;
    ConstrainedCoord y;
};

// Pixel <-> complex-plane mapping for a fixed image size.
struct View {
    uint32_t image_width    = 0;
    uint32_t image_height   = 0;
    double   scale_x        = 1.0;
    double   scale_y        = 1.0;
    double   plane_origin_x = 0.0;
    double   plane_origin_y = 0.0;

    // Square pixels, plane centered on (0,0), plane_width units across.
    static View new_uniform(uint32_t width, uint32_t height, double plane_width)
    {
        const double scale        = plane_width / width;
        const double plane_height = height * scale;

        View v;
        v.image_width    = width;
        v.image_height   = height;
        v.scale_x        = scale;
        v.scale_y        = scale;
        v.plane_origin_x = -plane_width * 0.5;
        v.plane_origin_y = -plane_height * 0.5;
        return v;
    }

    size_t pixel_count() const
    {
        return static_cast<size_t>(image_width) * image_height;
    }

    std::complex<double> plane_of(uint32_t x, uint32_t y) const
    {
        return {x * scale_x + plane_origin_x, y * scale_y + plane_origin_y};
    }

    // Lower bound is exclusive on the plane coordinate, upper bound is
    // exclusive on the derived pixel index.
    PixelCoords pixel_of(std::complex<double> p) const
    {
        return {constrain(p.real(), plane_origin_x, scale_x, image_width),
                constrain(p.imag(), plane_origin_y, scale_y, image_height)};
    }

private:
    // Absorbs the rounding of plane_of() in the truncation so that exact pixel
    // positions map back onto themselves instead of the pixel before. The
    // range tests use the exact offset.
    static constexpr double PIXEL_EPSILON = 1e-9;

    static ConstrainedCoord constrain(double plane, double origin, double scale,
                                      uint32_t dimension)
    {
        if (!(plane > origin))
            return ConstrainedCoord::below();

        const double offset = (plane - origin) / scale;
        if (offset >= static_cast<double>(dimension))
            return ConstrainedCoord::above();
        const auto index = static_cast<uint32_t>(offset + PIXEL_EPSILON);
        return ConstrainedCoord::within(std::min(index, dimension - 1));
    }
};
