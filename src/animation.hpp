#pragma once

#include "config.hpp"
#include "export.hpp"

#include <cstdint>

struct AnimationStats {
    uint32_t frames       = 0;
    double   duration_s   = 0.0;   // video length according to the time base
    double   wall_ms      = 0.0;
    double   path_length  = 0.0;
};

// Renders one frame per sample point of cfg.path and hands each to sink in
// order, pts = frame index. Julia mode animates the Julia constant along the
// path; Mandelbrot mode renders the set once and moves a crosshair over it.
//
// Throws ConfigError for a path of zero length, EncoderError when the sink
// fails (remaining frames are not rendered) and WorkerError from the engine.
AnimationStats render_animation(const RenderConfig& cfg, FrameSink& sink);
