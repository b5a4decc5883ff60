#include "animation.hpp"
#include "cpu_renderer.hpp"
#include "overlay.hpp"
#include "path_sampler.hpp"
#include "render_error.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>

namespace {

void print_fractal_progress(const std::vector<float>& progress)
{
    std::fprintf(stderr, "Fractal progress:");
    for (float p : progress)
        std::fprintf(stderr, " %.2f%%", p * 100.0f);
    std::fprintf(stderr, "\n");
}

void check_sink(const std::string& err, const char* stage)
{
    if (!err.empty())
        throw EncoderError(std::string("frame sink ") + stage + ": " + err);
}

} // namespace

AnimationStats render_animation(const RenderConfig& cfg, FrameSink& sink)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const View view = View::new_uniform(cfg.image_width, cfg.image_height,
                                        cfg.plane_width);

    const double length = approximate_length(cfg.path, cfg.path_tolerance);
    if (!(length > 0.0))
        throw ConfigError("path", "path has zero length");
    if (!std::isfinite(length))
        throw ConfigError("path", "path length is not finite");

    const double interval = length / cfg.frames;
    const std::vector<PathPoint> points =
        sample_points(cfg.path, cfg.path_tolerance, interval);
    const auto total = static_cast<uint32_t>(points.size());

    CpuRenderer renderer;
    renderer.set_thread_count(cfg.threads);
    renderer.set_progress(print_fractal_progress, cfg.fractal_progress_interval);

    std::fprintf(stderr, "Rendering %u frames of %ux%u (%s, %s, %d threads) as %s\n",
                 total, cfg.image_width, cfg.image_height,
                 cfg.mandelbrot ? "mandelbrot" : "julia",
                 cfg.smoothing.to_string().c_str(), renderer.thread_count,
                 format_name(cfg.format));

    check_sink(sink.start(), "start");

    PixelBuffer base;
    if (cfg.mandelbrot)
        renderer.render(ValueGenerator::mandelbrot(view, cfg.iterations, cfg.smoothing),
                        base);

    PixelBuffer frame;
    auto last_report = t0;
    for (uint32_t i = 0; i < total; ++i) {
        const PathPoint& p = points[i];
        if (cfg.mandelbrot) {
            frame = base;
            draw_constrained_crosshair(frame, view.pixel_of({p.x, p.y}));
        } else {
            renderer.render(ValueGenerator::julia(view, {p.x, p.y}, cfg.iterations,
                                                  cfg.smoothing),
                            frame);
        }

        check_sink(sink.write_frame(frame, static_cast<int64_t>(i)), "write");

        const auto now = clock::now();
        if (now - last_report >= cfg.video_progress_interval || i + 1 == total) {
            std::fprintf(stderr, "Frame %u/%u (%.2f%%)\n", i + 1, total,
                         100.0 * (i + 1) / total);
            last_report = now;
        }
    }

    check_sink(sink.finish(), "finish");

    AnimationStats stats;
    stats.frames      = total;
    stats.duration_s  = total * cfg.time_base.to_double();
    stats.path_length = length;
    stats.wall_ms     = std::chrono::duration<double, std::milli>(
                            clock::now() - t0).count();

    std::fprintf(stderr, "Done: %u frames, %.3f s of video at %d/%d, %.1f ms\n",
                 stats.frames, stats.duration_s, cfg.time_base.num, cfg.time_base.den,
                 stats.wall_ms);
    return stats;
}
