#pragma once

#include "palette.hpp"
#include "smoothing.hpp"
#include "view.hpp"

#include <complex>
#include <cstdint>

enum class FractalMode {
    Mandelbrot = 0,  // c = pixel, z0 = 0 (first step to c is free)
    Julia      = 1,  // c fixed,   z0 = pixel
};

// Escape-time loop shared by both modes. Stops the first time |z|^2 exceeds
// the smoothing radius (tested before each step) and hands the step count,
// final z and pre-escape z to the smoothing policy.
//
// Mandelbrot orbits start at z = 0, whose first step always lands on c; the
// loop starts at c and does not count that step.
template<bool IsJulia>
inline double escape_kernel(double re, double im, double cr, double ci,
                            uint32_t max_iter, const Smoothing& smoothing)
{
    double zr = re;
    double zi = im;
    const double c_re    = IsJulia ? cr : re;
    const double c_im    = IsJulia ? ci : im;
    const double radius2 = smoothing.escape_radius_squared();

    double   pr = zr, pi = zi;
    uint32_t n  = 0;
    while (n < max_iter) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        if (zr2 + zi2 > radius2) break;
        pr = zr;
        pi = zi;
        zi = 2.0*zr*zi + c_im;
        zr = zr2 - zi2 + c_re;
        ++n;
    }
    return smoothing.smooth(n, {zr, zi}, {pr, pi});
}

// Everything needed to color one pixel. Cheap to copy; each worker gets one.
struct ValueGenerator {
    View                 view;
    FractalMode          mode       = FractalMode::Mandelbrot;
    std::complex<double> c          = {0.0, 0.0};   // Julia constant
    uint32_t             iterations = 100;
    Smoothing            smoothing;

    static ValueGenerator mandelbrot(const View& v, uint32_t iterations,
                                     const Smoothing& s)
    {
        return {v, FractalMode::Mandelbrot, {0.0, 0.0}, iterations, s};
    }

    static ValueGenerator julia(const View& v, std::complex<double> c,
                                uint32_t iterations, const Smoothing& s)
    {
        return {v, FractalMode::Julia, c, iterations, s};
    }

    double evaluate(std::complex<double> p) const
    {
        if (mode == FractalMode::Julia)
            return escape_kernel<true>(p.real(), p.imag(), c.real(), c.imag(),
                                       iterations, smoothing);
        return escape_kernel<false>(p.real(), p.imag(), 0.0, 0.0,
                                    iterations, smoothing);
    }

    double pixel_value(uint32_t x, uint32_t y) const
    {
        return evaluate(view.plane_of(x, y));
    }

    RGBAColor color_of(double value) const
    {
        return escape_color(value, iterations);
    }

    RGBAColor pixel(uint32_t x, uint32_t y) const
    {
        return color_of(pixel_value(x, y));
    }
};
