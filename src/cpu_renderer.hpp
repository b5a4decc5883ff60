#pragma once

#include "fractal.hpp"
#include "renderer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

// Receives one completion fraction (0..1) per worker.
using ProgressCallback = std::function<void(const std::vector<float>&)>;

// Computes the color of pixel (x, y). Copied once into every worker.
using PixelFunction = std::function<RGBAColor(uint32_t, uint32_t)>;

class CpuRenderer {
public:
    CpuRenderer();

    // Blocks until every pixel of buf has been computed. Throws WorkerError
    // if any worker throws.
    void render(const ValueGenerator& gen, PixelBuffer& buf);
    void render_pixels(uint32_t width, uint32_t height, const PixelFunction& fn,
                       PixelBuffer& buf);

    // Called from the rendering thread, at most once per interval.
    void set_progress(ProgressCallback cb, std::chrono::milliseconds interval);

    double last_render_ms = 0.0;
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Number of pixels worker `worker` of `workers` gets out of `total`.
    static size_t share_of(size_t total, int workers, int worker);

private:
    ProgressCallback          progress_cb;
    std::chrono::milliseconds progress_interval{1000};
};
