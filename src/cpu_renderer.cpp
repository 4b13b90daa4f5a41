#include "cpu_renderer.hpp"
#include "escape_kernel.hpp"
#include "render_settings.hpp"
#include "viewport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

// -----------------------------------------------------------------------
// Constructor: size the worker pool to the machine
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
    pool = std::make_unique<ThreadPool>(n);
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    if (n == thread_count) return;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
    spdlog::info("cpu renderer: {} worker threads", n);
}

void CpuRenderer::resize(int w, int h)
{
    if (w <= 0 || h <= 0)
        throw std::invalid_argument("canvas size must be positive");
    if (w == pbuf.width && h == pbuf.height) return;
    pbuf.resize(w, h);
}

void CpuRenderer::set_color_ramp(const std::string& name, double gamma)
{
    if (!has_palette(name))
        spdlog::warn("cpu renderer: unknown palette '{}', using classic", name);
    color_ramp.load(name, gamma);
}

// -----------------------------------------------------------------------
// Tile renderer, called from thread pool workers
// -----------------------------------------------------------------------
void CpuRenderer::render_tile(const Viewport& vp, const RenderSettings& s,
                              int tx, int ty, int tw, int th)
{
    const int    W        = pbuf.width;
    const int    H        = pbuf.height;
    const int    max_iter = s.max_iterations;
    const double step_re  = vp.width  / W;
    const double step_im  = vp.height / H;
    // Sample pixel centers.
    const double re0      = vp.center_re - vp.width  * 0.5 + step_re * 0.5;
    const double im0      = vp.center_im + vp.height * 0.5 - step_im * 0.5;
    const uint32_t inside = pack_rgb(s.inside_color);

    for (int py = ty; py < ty + th && py < H; ++py) {
        const double im  = im0 - py * step_im;
        uint32_t*    row = pbuf.pixels.data() + static_cast<size_t>(py) * W;
        const int    end = std::min(tx + tw, W);

        for (int px = tx; px < end; ++px) {
            if (s.debug_mode == DebugMode::Gradient) {
                const float u = (px + 0.5f) / static_cast<float>(W);
                const float v = 1.0f - (py + 0.5f) / static_cast<float>(H);
                row[px] = pack_rgb({u, v, 0.0f});
                continue;
            }

            const double    re   = re0 + px * step_re;
            const OrbitExit exit = iterate_orbit(re, im, max_iter);
            if (exit.iterations >= max_iter) {
                row[px] = inside;
                continue;
            }

            double t;
            if (s.smooth_coloring)
                t = smooth_from_magnitude(exit.iterations, std::sqrt(exit.magnitude_sq),
                                          max_iter) / max_iter;
            else
                t = static_cast<double>(exit.iterations) / max_iter;
            t = std::max(0.0, std::min(1.0, t));

            if (s.debug_mode == DebugMode::Grayscale) {
                const float g = static_cast<float>(t);
                row[px] = pack_rgb({g, g, g});
            } else {
                row[px] = color_ramp.shade(t);
            }
        }
    }
}

// -----------------------------------------------------------------------
// Top-level draw: splits the canvas into tiles and dispatches to the pool
// -----------------------------------------------------------------------
RenderStats CpuRenderer::draw(const Viewport& vp, const RenderSettings& s)
{
    using clock = std::chrono::steady_clock;

    const int W = pbuf.width, H = pbuf.height;
    if (W <= 0 || H <= 0)
        throw std::runtime_error("cpu renderer: draw before resize()");

    const auto t0 = clock::now();

    constexpr int TILE_W = 64;
    constexpr int TILE_H = 64;

    for (int ty = 0; ty < H; ty += TILE_H) {
        for (int tx = 0; tx < W; tx += TILE_W) {
            const int tw = std::min(TILE_W, W - tx);
            const int th = std::min(TILE_H, H - ty);
            pool->submit([this, vp, &s, tx, ty, tw, th] {
                render_tile(vp, s, tx, ty, tw, th);
            });
        }
    }
    pool->wait();

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
    ++draw_count;

    RenderStats stats;
    stats.iteration_count = s.max_iterations;
    stats.render_ms       = last_render_ms;
    stats.frame_ms        = last_render_ms;
    return stats;
}
