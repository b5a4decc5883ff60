#include "cpu_renderer.hpp"
#include "render_error.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

RGBAColor coord_color(uint32_t x, uint32_t y)
{
    return {static_cast<uint8_t>(x), static_cast<uint8_t>(y),
            static_cast<uint8_t>(x ^ y), 255};
}

} // namespace

TEST(CpuRenderer, ShareOfPartitionsExactly)
{
    EXPECT_EQ(CpuRenderer::share_of(10, 4, 0), 3u);
    EXPECT_EQ(CpuRenderer::share_of(10, 4, 1), 3u);
    EXPECT_EQ(CpuRenderer::share_of(10, 4, 2), 2u);
    EXPECT_EQ(CpuRenderer::share_of(10, 4, 3), 2u);

    for (size_t total : {0u, 1u, 7u, 1000u, 1001u}) {
        for (int k : {1, 2, 3, 8, 13}) {
            size_t sum = 0;
            for (int i = 0; i < k; ++i) sum += CpuRenderer::share_of(total, k, i);
            EXPECT_EQ(sum, total) << total << " over " << k;
        }
    }
}

TEST(CpuRenderer, ThreadCount)
{
    CpuRenderer r;
    EXPECT_GE(r.hw_concurrency, 1);
    r.set_thread_count(3);
    EXPECT_EQ(r.thread_count, 3);
    r.set_thread_count(0);
    EXPECT_EQ(r.thread_count, r.hw_concurrency);
}

TEST(CpuRenderer, EveryPixelLandsInPlace)
{
    CpuRenderer r;
    r.set_thread_count(5);
    PixelBuffer buf;
    r.render_pixels(37, 23, coord_color, buf);

    ASSERT_EQ(buf.width, 37u);
    ASSERT_EQ(buf.height, 23u);
    for (uint32_t y = 0; y < 23; ++y)
        for (uint32_t x = 0; x < 37; ++x)
            ASSERT_EQ(buf.at(x, y), coord_color(x, y)) << x << "," << y;
}

TEST(CpuRenderer, WorkerCountDoesNotChangeImage)
{
    const View view = View::new_uniform(61, 47, 3.2);
    const ValueGenerator gen = ValueGenerator::julia(
        view, {-0.7269, 0.1889}, 120, Smoothing::logarithmic_distance(4.0, 2.0));

    CpuRenderer one;
    one.set_thread_count(1);
    PixelBuffer a;
    one.render(gen, a);

    CpuRenderer four;
    four.set_thread_count(4);
    PixelBuffer b;
    four.render(gen, b);

    EXPECT_EQ(a.bytes, b.bytes);
}

TEST(CpuRenderer, MoreWorkersThanPixels)
{
    const View view = View::new_uniform(3, 1, 3.0);
    const ValueGenerator gen = ValueGenerator::mandelbrot(view, 50, Smoothing::none());

    CpuRenderer one;
    one.set_thread_count(1);
    PixelBuffer a;
    one.render(gen, a);

    CpuRenderer many;
    many.set_thread_count(8);
    PixelBuffer b;
    many.render(gen, b);

    EXPECT_EQ(a.bytes, b.bytes);
}

TEST(CpuRenderer, EmptyImage)
{
    CpuRenderer r;
    PixelBuffer buf;
    r.render_pixels(0, 10, coord_color, buf);
    EXPECT_TRUE(buf.bytes.empty());
}

TEST(CpuRenderer, ReportsPerWorkerProgress)
{
    CpuRenderer r;
    r.set_thread_count(2);

    int   calls = 0;
    bool  sized = true;
    float worst = 0.0f;
    r.set_progress([&](const std::vector<float>& p) {
        ++calls;
        sized = sized && p.size() == 2;
        for (float f : p) {
            EXPECT_GE(f, 0.0f);
            EXPECT_LE(f, 1.0f);
            worst = std::max(worst, f);
        }
    }, std::chrono::milliseconds(0));

    PixelBuffer buf;
    r.render_pixels(128, 64, coord_color, buf);

    EXPECT_GT(calls, 0);
    EXPECT_TRUE(sized);
    EXPECT_GT(worst, 0.0f);
    EXPECT_GE(r.last_render_ms, 0.0);
}

TEST(CpuRenderer, ThrowingWorkerBecomesWorkerError)
{
    CpuRenderer r;
    r.set_thread_count(4);

    // index 5 = (5, 0) on a 10-wide image belongs to worker 5 % 4 = 1
    auto fn = [](uint32_t x, uint32_t y) -> RGBAColor {
        if (x == 5 && y == 0) throw std::runtime_error("bad pixel");
        return coord_color(x, y);
    };

    PixelBuffer buf;
    try {
        r.render_pixels(10, 10, fn, buf);
        FAIL() << "expected WorkerError";
    } catch (const WorkerError& e) {
        EXPECT_EQ(e.worker_index(), 1);
        EXPECT_NE(std::string(e.what()).find("bad pixel"), std::string::npos);
    }

    // The renderer is usable again afterwards.
    r.render_pixels(10, 10, coord_color, buf);
    EXPECT_EQ(buf.at(5, 0), coord_color(5, 0));
}
