#pragma once

#include "export.hpp"
#include "path.hpp"
#include "smoothing.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

struct Rational {
    int num = 1;
    int den = 30;

    double to_double() const { return static_cast<double>(num) / den; }
};

// Parses "N/D" with positive integers. Throws std::invalid_argument.
Rational parse_rational(const std::string& text);

struct RenderConfig {
    uint32_t    image_width  = 0;
    uint32_t    image_height = 0;
    uint32_t    frames       = 0;
    double      plane_width  = 0.0;
    std::string path_data;
    Path        path;
    std::string output;

    uint32_t                  iterations                = 100;
    std::chrono::milliseconds fractal_progress_interval{1000};
    std::chrono::milliseconds video_progress_interval{1000};
    Rational                  time_base;
    double                    path_tolerance            = 0.01;
    Smoothing                 smoothing = Smoothing::logarithmic_distance(4.0, 2.0);
    bool                      mandelbrot                = false;
    int                       threads                   = 0;   // 0 = one per core
    OutputFormat              format                    = OutputFormat::Png;
};

struct ArgSpec {
    RenderConfig               config;
    bool                       show_help = false;
    std::optional<std::string> config_path{};
};

// Config file values provide defaults; command-line flags override them.
// Throws ConfigError naming the offending argument.
ArgSpec parse_args(int argc, const char* const* argv);

void print_help(const char* argv0);
