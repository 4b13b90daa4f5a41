#pragma once

#include "cpu_renderer.hpp"
#include "escape_kernel.hpp"
#include "render_settings.hpp"
#include "viewport.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <vector>

inline int run_cli_benchmark()
{
    CpuRenderer renderer;
    renderer.set_thread_count(1);

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    renderer.resize(W, H);
    renderer.set_color_ramp("classic", 1.0);

    struct TestCase {
        const char*   label;
        double        center_re;
        double        center_im;
        double        span;
        QualityPreset quality;
        bool          smooth;
    };

    const TestCase tests[] = {
        {"Home",             -0.5,      0.0,      3.15,   QualityPreset::High,  true },
        {"Home (banded)",    -0.5,      0.0,      3.15,   QualityPreset::High,  false},
        {"Seahorse valley",  -0.745,    0.113,    0.01,   QualityPreset::High,  true },
        {"Elephant valley",   0.282,    0.01,     0.02,   QualityPreset::High,  true },
        {"Spiral",           -0.7463,   0.1102,   0.005,  QualityPreset::Ultra, true },
        {"Home (interactive)",-0.5,     0.0,      3.15,   QualityPreset::Low,   true },
    };

    printf("Mandel Navigator CLI Benchmark\n");
    printf("%dx%d, 1 thread, %d runs (avg best %d)\n\n", W, H, RUNS, BEST_N);
    printf("%-22s %-8s %s\n", "Label", "Iter", "Mpix/s");
    printf("------------------------------------------\n");

    for (const auto& t : tests) {
        RenderSettings s;
        s.quality         = t.quality;
        s.max_iterations  = quality_iterations(t.quality);
        s.smooth_coloring = t.smooth;

        const double aspect = static_cast<double>(W) / H;
        const Viewport vp = create_viewport(t.center_re, t.center_im, t.span * aspect, t.span);

        // Warm-up
        renderer.draw(vp, s);

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r)
            times[r] = renderer.draw(vp, s).render_ms;
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        const double mpixs = (W * H) / (avg_ms * 1000.0);

        printf("%-22s %-8d %6.2f\n", t.label, s.max_iterations, mpixs);
    }

    // Reference kernel alone, no colouring or tiling.
    std::vector<PlanePoint> points;
    points.reserve(static_cast<size_t>(W) * 64);
    const Viewport home = reset_viewport(static_cast<double>(W) / H);
    for (int y = 0; y < 64; ++y)
        for (int x = 0; x < W; ++x)
            points.push_back(pixel_to_plane(home, x + 0.5, y * (H / 64.0), W, H));

    const auto t0 = std::chrono::steady_clock::now();
    const std::vector<double> res = batch_escape(points, 256, true);
    const double ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - t0).count();
    printf("%-22s %-8d %6.2f\n", "batch_escape", 256, res.size() / (ms * 1000.0));
    return 0;
}
