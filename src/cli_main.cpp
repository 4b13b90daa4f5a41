#include "cli_benchmark.hpp"
#include "export.hpp"
#include "palette.hpp"
#include "render_settings.hpp"
#include "viewport.hpp"

#include <args.hxx>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>
#include <string>

// "re,im" -> PlanePoint
static bool parse_center(const std::string& text, PlanePoint& out)
{
    double re = 0.0, im = 0.0;
    char   tail = 0;
    if (std::sscanf(text.c_str(), "%lf,%lf%c", &re, &im, &tail) != 2)
        return false;
    out = {re, im};
    return true;
}

int main(int argc, char* argv[])
{
    args::ArgumentParser parser("Mandel Navigator command line renderer",
                                "Without --render or --benchmark, prints the home view for the given size.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag benchmark(parser, "benchmark", "Single-thread render benchmark", { "benchmark" });
    args::ValueFlag<std::string> render(parser, "file", "Render one view to a PNG file", { 'o', "render" });
    args::ValueFlag<int> width(parser, "pixels", "Image width (default 1920)", { "width" });
    args::ValueFlag<int> height(parser, "pixels", "Image height (default 1080)", { "height" });
    args::ValueFlag<std::string> center(parser, "re,im", "View center (default home view)", { "center" });
    args::ValueFlag<double> span(parser, "units", "Imaginary-axis span of the view", { "span" });
    args::ValueFlag<std::string> quality(parser, "preset", "low, medium, high or ultra", { "quality" });
    args::ValueFlag<int> iterations(parser, "n", "Iteration budget (overrides --quality)", { "iterations" });
    args::ValueFlag<std::string> palette(parser, "name", "Colour palette", { "palette" });
    args::ValueFlag<double> gamma(parser, "g", "Palette gamma (default 1.0)", { "gamma" });
    args::Flag banded(parser, "banded", "Disable smooth colouring", { "banded" });
    args::Flag verbose(parser, "verbose", "Debug logging", { 'v', "verbose" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // Logs go to stderr; stdout carries the view description and benchmark table.
    spdlog::set_default_logger(spdlog::stderr_color_mt("mandelnav"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    if (benchmark)
        return run_cli_benchmark();

    const int w = width  ? args::get(width)  : 1920;
    const int h = height ? args::get(height) : 1080;
    if (w <= 0 || h <= 0) {
        spdlog::error("image size must be positive, got {}x{}", w, h);
        return 1;
    }
    const double aspect = static_cast<double>(w) / h;

    RenderSettings settings;
    if (quality) {
        if (!parse_quality(args::get(quality), settings.quality)) {
            spdlog::error("unknown quality preset '{}'", args::get(quality));
            return 1;
        }
        settings.max_iterations = quality_iterations(settings.quality);
    }
    if (iterations) settings.max_iterations = args::get(iterations);
    if (palette)    settings.palette        = args::get(palette);
    if (gamma)      settings.gamma          = args::get(gamma);
    if (banded)     settings.smooth_coloring = false;

    const std::string bad = validate_settings(settings);
    if (!bad.empty()) {
        spdlog::error("{}", bad);
        if (palette && !has_palette(settings.palette)) {
            std::string names;
            for (const std::string& n : palette_names())
                names += (names.empty() ? "" : ", ") + n;
            spdlog::info("available palettes: {}", names);
        }
        return 1;
    }

    Viewport vp = reset_viewport(aspect);
    if (center) {
        PlanePoint c;
        if (!parse_center(args::get(center), c)) {
            spdlog::error("--center expects re,im, got '{}'", args::get(center));
            return 1;
        }
        vp.center_re = c.re;
        vp.center_im = c.im;
    }
    if (span) {
        vp.height = args::get(span);
        vp.width  = vp.height * aspect;
    }
    if (!viewport_is_valid(vp)) {
        spdlog::error("--span must be a positive number");
        return 1;
    }

    spdlog::debug("view {} zoom {:.3g}x, {} iterations, palette {}",
                  describe_view(vp), zoom_factor(vp), settings.max_iterations, settings.palette);

    if (!render) {
        printf("%s\n", describe_view(vp).c_str());
        return 0;
    }

    const std::string err = export_view_png(args::get(render), vp, settings, w, h);
    if (!err.empty()) {
        spdlog::error("{}", err);
        return 1;
    }
    return 0;
}
