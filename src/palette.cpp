#include "palette.hpp"

#include <algorithm>
#include <cmath>

double wrap_range(double value, double min, double max)
{
    const double size = max - min;
    double v = std::fmod(value - min, size);
    if (v < 0.0) v += size;
    // fmod of a tiny negative number plus size can round up to size itself
    if (v >= size) v -= size;
    return v + min;
}

static uint8_t to_channel(double f)
{
    return static_cast<uint8_t>(f * 255.0 + 0.5);
}

// ---------------------------------------------------------------------------
// HSB -> RGB, one of six hue sectors
// ---------------------------------------------------------------------------
RGBAColor rgba_from_hsb(double hue, double saturation, double brightness,
                        double alpha)
{
    const uint8_t a = to_channel(alpha);
    if (saturation == 0.0) {
        const uint8_t v = to_channel(brightness);
        return {v, v, v, a};
    }

    const double sector    = (hue - std::floor(hue)) * 6.0;
    const double in_sector = sector - std::floor(sector);
    const double off       = brightness * (1.0 - saturation);
    const double fade_out  = brightness * (1.0 - saturation * in_sector);
    const double fade_in   = brightness * (1.0 - saturation * (1.0 - in_sector));

    switch (std::min(static_cast<int>(sector), 5)) {
        case 0:  return {to_channel(brightness), to_channel(fade_in),    to_channel(off),        a};
        case 1:  return {to_channel(fade_out),   to_channel(brightness), to_channel(off),        a};
        case 2:  return {to_channel(off),        to_channel(brightness), to_channel(fade_in),    a};
        case 3:  return {to_channel(off),        to_channel(fade_out),   to_channel(brightness), a};
        case 4:  return {to_channel(fade_in),    to_channel(off),        to_channel(brightness), a};
        default: return {to_channel(brightness), to_channel(off),        to_channel(fade_out),   a};
    }
}
