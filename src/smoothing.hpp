#pragma once

#include <complex>
#include <cstdint>
#include <string>

enum class SmoothingType {
    None                = 0,  // discrete iteration bands
    LogarithmicDistance = 1,  // fractional count from the pre-escape value
};

// Turns a raw escape result into the value fed to the palette, and supplies
// the escape radius the iterator tests against.
struct Smoothing {
    SmoothingType type   = SmoothingType::None;
    double        radius = 2.0;
    double        power  = 2.0;

    static Smoothing none() { return {}; }
    static Smoothing logarithmic_distance(double radius, double power)
    {
        return {SmoothingType::LogarithmicDistance, radius, power};
    }

    double escape_radius_squared() const { return radius * radius; }

    double smooth(uint32_t n, std::complex<double> z,
                  std::complex<double> z_prev) const;

    std::string to_string() const;

    bool operator==(const Smoothing& o) const
    {
        return type == o.type && radius == o.radius && power == o.power;
    }
};

// Accepts "None" or "LogarithmicDistance(radius, power)".
// Throws std::invalid_argument on anything else.
Smoothing parse_smoothing(const std::string& text);
