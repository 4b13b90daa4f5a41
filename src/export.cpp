#include "export.hpp"
#include "cpu_renderer.hpp"
#include "render_settings.hpp"
#include "viewport.hpp"

#include <png.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>

// ---------------------------------------------------------------------------
// PNG export
//
// Pixel layout: each uint32_t stores 0xAA BB GG RR.
// On a little-endian machine the bytes in memory are [R, G, B, A], which is
// exactly what PNG_COLOR_TYPE_RGBA expects.
// ---------------------------------------------------------------------------
std::string export_png(const std::string& path, const PixelBuffer& buf,
                       const Viewport* vp)
{
    if (buf.width <= 0 || buf.height <= 0 || buf.pixels.empty())
        return "Nothing to export: image is empty";

    FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp)
        return "Cannot open file for writing: " + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    // Must outlive png_write_info.
    std::string comment = vp ? describe_view(*vp) : std::string();

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);

    png_text text[2] = {};
    text[0].compression = PNG_TEXT_COMPRESSION_NONE;
    text[0].key         = const_cast<png_charp>("Software");
    text[0].text        = const_cast<png_charp>("Mandel Navigator");
    int text_count = 1;
    if (vp) {
        text[1].compression = PNG_TEXT_COMPRESSION_NONE;
        text[1].key         = const_cast<png_charp>("Comment");
        text[1].text        = &comment[0];
        text_count = 2;
    }
    png_set_text(png, info, text, text_count);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        const png_const_bytep row = reinterpret_cast<png_const_bytep>(
            buf.pixels.data() + static_cast<size_t>(y) * buf.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return "Error closing " + path;
    return {};
}

std::string export_view_png(const std::string& path, const Viewport& vp,
                            const RenderSettings& settings, int width, int height)
{
    if (width <= 0 || height <= 0)
        return "Export size must be positive";
    if (!viewport_is_valid(vp))
        return "Viewport has a non-positive or non-finite span";
    const std::string bad = validate_settings(settings);
    if (!bad.empty())
        return bad;

    CpuRenderer renderer;
    try {
        renderer.resize(width, height);
        renderer.set_color_ramp(settings.palette, settings.gamma);
        const RenderStats stats = renderer.draw(vp, settings);
        spdlog::info("export: rendered {}x{} in {:.1f} ms", width, height, stats.render_ms);
    } catch (const std::exception& e) {
        return std::string("Render failed: ") + e.what();
    }

    std::string err = export_png(path, renderer.buffer(), &vp);
    if (err.empty())
        spdlog::info("export: wrote {}", path);
    else
        spdlog::error("export: {}", err);
    return err;
}

std::string describe_view(const Viewport& vp)
{
    char text[160];
    std::snprintf(text, sizeof(text), "center=%.17g,%.17g span=%.17gx%.17g",
                  vp.center_re, vp.center_im, vp.width, vp.height);
    return text;
}
