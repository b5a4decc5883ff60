#include "cpu_renderer.hpp"
#include "channel.hpp"
#include "render_error.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {

// Pixels per channel message.
constexpr size_t CHUNK_PIXELS = 1024;

struct PixelChunk {
    int                                       worker = 0;
    std::vector<std::pair<size_t, RGBAColor>> pixels;
    std::exception_ptr                        error;   // set on failure only
};

using ChunkChannel = Channel<PixelChunk>;

// Worker `id` owns indices id, id+stride, id+2*stride, ... (count of them).
void worker_main(int id, size_t count, size_t stride, uint32_t width,
                 PixelFunction fn, ChunkChannel::Sender tx,
                 std::atomic<float>& progress)
{
    try {
        PixelChunk chunk;
        chunk.worker = id;
        chunk.pixels.reserve(std::min(count, CHUNK_PIXELS));

        for (size_t i = 0; i < count; ++i) {
            const size_t index = static_cast<size_t>(id) + i * stride;
            const auto   x     = static_cast<uint32_t>(index % width);
            const auto   y     = static_cast<uint32_t>(index / width);
            chunk.pixels.emplace_back(index, fn(x, y));

            if (chunk.pixels.size() == CHUNK_PIXELS) {
                tx.send(std::move(chunk));
                chunk = PixelChunk{};
                chunk.worker = id;
                chunk.pixels.reserve(CHUNK_PIXELS);
            }
            progress.store(static_cast<float>(i + 1) / static_cast<float>(count),
                           std::memory_order_relaxed);
        }
        if (!chunk.pixels.empty())
            tx.send(std::move(chunk));
    } catch (...) {
        // Forwarded to the coordinator, which turns it into a WorkerError.
        PixelChunk failure;
        failure.worker = id;
        failure.error  = std::current_exception();
        tx.send(std::move(failure));
    }
}

// Joins every started worker when the coordinator leaves render_pixels(),
// including by exception.
struct JoinAll {
    std::vector<std::thread>& threads;
    ~JoinAll()
    {
        for (auto& t : threads)
            if (t.joinable()) t.join();
    }
};

} // namespace

// -----------------------------------------------------------------------
// Constructor: detect core count
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    thread_count = n;
}

void CpuRenderer::set_progress(ProgressCallback cb, std::chrono::milliseconds interval)
{
    progress_cb       = std::move(cb);
    progress_interval = interval;
}

size_t CpuRenderer::share_of(size_t total, int workers, int worker)
{
    const auto k = static_cast<size_t>(workers);
    return total / k + (static_cast<size_t>(worker) < total % k ? 1 : 0);
}

void CpuRenderer::render(const ValueGenerator& gen, PixelBuffer& buf)
{
    render_pixels(gen.view.image_width, gen.view.image_height,
                  [gen](uint32_t x, uint32_t y) { return gen.pixel(x, y); },
                  buf);
}

// -----------------------------------------------------------------------
// Top-level render: interleaved partition, results collected over a channel
// -----------------------------------------------------------------------
void CpuRenderer::render_pixels(uint32_t width, uint32_t height,
                                const PixelFunction& fn, PixelBuffer& buf)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    buf.resize(width, height);
    const size_t total = buf.pixel_count();
    if (total == 0) {
        last_render_ms = 0.0;
        return;
    }

    const int k = std::max(1, thread_count);

    auto progress = std::make_unique<std::atomic<float>[]>(k);
    for (int i = 0; i < k; ++i)
        progress[i].store(0.0f, std::memory_order_relaxed);

    ChunkChannel             channel;
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(k));
    JoinAll join_all{workers};

    {
        ChunkChannel::Sender tx = channel.sender();
        for (int i = 0; i < k; ++i) {
            const size_t count = share_of(total, k, i);
            if (count == 0)
                progress[i].store(1.0f, std::memory_order_relaxed);
            workers.emplace_back(worker_main, i, count, static_cast<size_t>(k),
                                 width, fn, tx, std::ref(progress[i]));
        }
    }   // only the workers hold senders now

    size_t             written      = 0;
    int                failed       = -1;
    std::exception_ptr failure;
    auto               last_report  = t0;
    std::vector<float> snapshot(static_cast<size_t>(k));

    while (auto chunk = channel.recv()) {
        if (chunk->error) {
            if (failed < 0) {
                failed  = chunk->worker;
                failure = chunk->error;
            }
            continue;
        }
        for (const auto& px : chunk->pixels)
            buf.set(px.first, px.second);
        written += chunk->pixels.size();

        if (progress_cb) {
            const auto now = clock::now();
            if (now - last_report >= progress_interval) {
                for (int i = 0; i < k; ++i)
                    snapshot[i] = progress[i].load(std::memory_order_relaxed);
                progress_cb(snapshot);
                last_report = now;
            }
        }
    }

    for (auto& t : workers) t.join();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            throw WorkerError(failed, e.what());
        } catch (...) {
            throw WorkerError(failed, "unknown exception");
        }
    }
    if (written != total)
        throw std::logic_error("fractal render wrote " + std::to_string(written) +
                               " of " + std::to_string(total) + " pixels");

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}
