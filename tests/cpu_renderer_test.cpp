#include "cpu_renderer.hpp"
#include "render_settings.hpp"
#include "viewport.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

// Deep inside the main cardioid: every sample is interior.
const Viewport INTERIOR = create_viewport(-0.1, 0.0, 0.016, 0.009);
// Far outside: every orbit escapes on the first check after z1 = c.
const Viewport EXTERIOR = create_viewport(10.0, 10.0, 1.6, 0.9);

uint8_t channel(uint32_t px, int c) { return static_cast<uint8_t>(px >> (8 * c)); }

} // namespace

TEST(CpuRendererTest, DrawBeforeResizeThrows)
{
    CpuRenderer r;
    EXPECT_THROW(r.draw(INTERIOR, RenderSettings{}), std::runtime_error);
    EXPECT_EQ(r.draw_count, 0);
}

TEST(CpuRendererTest, ResizeRejectsNonPositiveSizes)
{
    CpuRenderer r;
    EXPECT_THROW(r.resize(0, 10), std::invalid_argument);
    EXPECT_THROW(r.resize(10, -1), std::invalid_argument);

    r.resize(80, 45);
    EXPECT_EQ(r.buffer().width, 80);
    EXPECT_EQ(r.buffer().height, 45);
    EXPECT_EQ(r.buffer().pixels.size(), 80u * 45u);
}

TEST(CpuRendererTest, InteriorUsesInsideColour)
{
    CpuRenderer r;
    r.resize(96, 54);
    RenderSettings s;
    s.inside_color = {1.0f, 0.0f, 0.5f};

    const RenderStats stats = r.draw(INTERIOR, s);
    EXPECT_EQ(stats.iteration_count, 256);
    EXPECT_GE(stats.render_ms, 0.0);
    EXPECT_EQ(r.draw_count, 1);

    const uint32_t inside = pack_rgb(s.inside_color);
    for (uint32_t px : r.buffer().pixels)
        ASSERT_EQ(px, inside);
}

TEST(CpuRendererTest, ExteriorUsesRamp)
{
    CpuRenderer r;
    r.resize(64, 36);
    RenderSettings s;
    s.smooth_coloring = false;
    r.set_color_ramp("ice", 1.0);

    r.draw(EXTERIOR, s);
    const uint32_t expected = r.ramp().shade(1.0 / 256.0);
    for (uint32_t px : r.buffer().pixels)
        ASSERT_EQ(px, expected);
}

TEST(CpuRendererTest, GradientDebugMode)
{
    CpuRenderer r;
    r.resize(40, 20);
    RenderSettings s;
    s.debug_mode = DebugMode::Gradient;
    r.draw(EXTERIOR, s);

    const PixelBuffer& b = r.buffer();
    EXPECT_EQ(b.pixels[0], pack_rgb({0.5f / 40.0f, 1.0f - 0.5f / 20.0f, 0.0f}));
    EXPECT_EQ(b.pixels.back(), pack_rgb({39.5f / 40.0f, 1.0f - 19.5f / 20.0f, 0.0f}));
    EXPECT_LT(channel(b.pixels[0], 0), channel(b.pixels.back(), 0));
    EXPECT_GT(channel(b.pixels[0], 1), channel(b.pixels.back(), 1));
}

TEST(CpuRendererTest, GrayscaleDebugMode)
{
    CpuRenderer r;
    r.resize(64, 64);
    RenderSettings s;
    s.debug_mode = DebugMode::Grayscale;
    r.draw(reset_viewport(1.0), s);

    for (uint32_t px : r.buffer().pixels) {
        if (px == pack_rgb(s.inside_color)) continue;
        ASSERT_EQ(channel(px, 0), channel(px, 1));
        ASSERT_EQ(channel(px, 1), channel(px, 2));
    }
}

TEST(CpuRendererTest, ColorRampFollowsRequests)
{
    CpuRenderer r;
    EXPECT_EQ(r.ramp().key(), "classic");

    r.set_color_ramp("sunset", 1.8);
    EXPECT_EQ(r.ramp().key(), "sunset");
    EXPECT_DOUBLE_EQ(r.ramp().gamma(), 1.8);

    EXPECT_NO_THROW(r.set_color_ramp("no-such-ramp", 1.0));
}

TEST(CpuRendererTest, OutputIndependentOfThreadCount)
{
    RenderSettings s;
    s.max_iterations = 128;
    const Viewport vp = create_viewport(-0.745, 0.11, 0.05, 0.05 * 90.0 / 160.0);

    CpuRenderer a;
    a.set_thread_count(1);
    a.resize(160, 90);
    a.draw(vp, s);

    CpuRenderer b;
    b.set_thread_count(4);
    b.resize(160, 90);
    b.draw(vp, s);

    EXPECT_EQ(a.thread_count, 1);
    EXPECT_EQ(b.thread_count, 4);
    EXPECT_EQ(a.buffer().pixels, b.buffer().pixels);
}

TEST(CpuRendererTest, ThreadCountAutoRestoresHardwareCount)
{
    CpuRenderer r;
    r.set_thread_count(2);
    r.set_thread_count(0);
    EXPECT_EQ(r.thread_count, r.hw_concurrency);
    EXPECT_GE(r.hw_concurrency, 1);
}
