#pragma once

#include "renderer.hpp"
#include "palette.hpp"
#include "thread_pool.hpp"

#include <memory>

struct Viewport;
struct RenderSettings;

// Tile-parallel CPU rendering surface. Pixels are written into an owned
// PixelBuffer sized with resize(); the host uploads it after each draw.
class CpuRenderer : public RenderSurface {
public:
    CpuRenderer();

    RenderStats draw(const Viewport& vp, const RenderSettings& settings) override;
    void        set_color_ramp(const std::string& name, double gamma) override;

    // Throws std::invalid_argument for non-positive sizes.
    void resize(int w, int h);

    const PixelBuffer& buffer() const { return pbuf; }
    const ColorRamp&   ramp()   const { return color_ramp; }

    // n <= 0 restores hw_concurrency
    void set_thread_count(int n);

    double last_render_ms = 0.0;
    int    thread_count   = 0;
    int    hw_concurrency = 0;   // logical CPU count detected at startup
    long   draw_count     = 0;

private:
    void render_tile(const Viewport& vp, const RenderSettings& settings,
                     int tx, int ty, int tw, int th);

    std::unique_ptr<ThreadPool> pool;
    PixelBuffer                 pbuf;
    ColorRamp                   color_ramp;
};
