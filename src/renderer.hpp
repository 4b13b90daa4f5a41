#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Viewport;
struct RenderSettings;

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR
struct PixelBuffer {
    std::vector<uint32_t> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0xFF000000u);
    }
};

struct RenderStats {
    int    iteration_count = 0;
    double render_ms       = 0.0;
    double frame_ms        = 0.0;
};

// The drawing collaborator the scheduler drives. draw() is fire-and-forget
// from the caller's side: it may be invoked from inside a frame callback and
// reports timing only. Failures are thrown.
class RenderSurface {
public:
    virtual ~RenderSurface() = default;
    virtual RenderStats draw(const Viewport& vp, const RenderSettings& settings) = 0;
    virtual void        set_color_ramp(const std::string& name, double gamma) = 0;
};
