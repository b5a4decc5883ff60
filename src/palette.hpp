#pragma once

#include <cstdint>

// One RGBA8 pixel, laid out exactly as it sits in a PixelBuffer.
struct RGBAColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const RGBAColor& o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const RGBAColor& o) const { return !(*this == o); }
};

static constexpr RGBAColor INTERIOR_COLOR  = {0, 0, 0, 255};
static constexpr RGBAColor CROSSHAIR_COLOR = {255, 255, 255, 255};

// Wraps value into [min, max) in either direction.
double wrap_range(double value, double min, double max);

// Sector-based HSB -> RGB. All inputs in 0..1 (hue is taken modulo 1).
RGBAColor rgba_from_hsb(double hue, double saturation, double brightness,
                        double alpha);

// Map a (smoothed) escape value to a pixel.
inline RGBAColor escape_color(double value, uint32_t iterations)
{
    if (value >= static_cast<double>(iterations))
        return INTERIOR_COLOR;

    // Hue cycles every ~77.6 units, brightness every 16.
    return rgba_from_hsb(wrap_range(value * 3.3, 0.0, 256.0) / 256.0,
                         1.0,
                         wrap_range(value * 16.0, 0.0, 256.0) / 256.0,
                         1.0);
}
