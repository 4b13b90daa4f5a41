#include "zoom_planner.hpp"

#include <cmath>
#include <limits>

double sanitize_span(double span)
{
    if (!std::isfinite(span) || !(span > 0.0))
        return std::numeric_limits<double>::denorm_min();
    return span;
}

static double sanitize_aspect(double aspect)
{
    if (!std::isfinite(aspect) || !(aspect > 0.0))
        return 1.0;
    return aspect;
}

// Non-finite centers fall back to the source view; spans are forced positive
// and finite.
static Viewport finish(double center_re, double center_im,
                       double width, double height, const Viewport& fallback)
{
    Viewport out;
    out.center_re = std::isfinite(center_re) ? center_re : fallback.center_re;
    out.center_im = std::isfinite(center_im) ? center_im : fallback.center_im;
    out.width     = sanitize_span(width);
    out.height    = sanitize_span(height);
    return out;
}

Viewport zoom_to_rect(const Viewport& vp, const PixelRect& rect,
                      const CanvasSize& canvas)
{
    const double aspect = aspect_ratio(canvas);

    const double cx = rect.x + rect.width  * 0.5;
    const double cy = rect.y + rect.height * 0.5;
    const PlanePoint center = pixel_to_plane(vp, cx, cy, canvas.width, canvas.height);

    const double rect_aspect = rect.width / rect.height;

    double new_w, new_h;
    if (rect_aspect > aspect) {
        new_w = sanitize_span((rect.width / canvas.width) * vp.width);
        new_h = new_w / aspect;
    } else {
        new_h = sanitize_span((rect.height / canvas.height) * vp.height);
        new_w = new_h * aspect;
    }
    return finish(center.re, center.im, new_w, new_h, vp);
}

Viewport zoom_toward_point(const Viewport& vp, PlanePoint target,
                           double factor, double aspect_ratio)
{
    const double aspect = sanitize_aspect(aspect_ratio);
    const double width  = sanitize_span(vp.width / factor);
    return finish(target.re, target.im, width, width / aspect, vp);
}

Viewport hold_zoom_trajectory(const Viewport& start, PlanePoint target,
                              double aspect_ratio, double elapsed_seconds,
                              double rate_per_second)
{
    const double aspect = sanitize_aspect(aspect_ratio);
    const double t      = elapsed_seconds > 0.0 ? elapsed_seconds : 0.0;
    const double width  = sanitize_span(start.width * std::exp(-rate_per_second * t));
    return finish(target.re, target.im, width, width / aspect, start);
}

Viewport zoom_about_pixel(const Viewport& vp, double px, double py,
                          const CanvasSize& canvas, double factor)
{
    const PlanePoint anchor = pixel_to_plane(vp, px, py, canvas.width, canvas.height);

    Viewport scaled = vp;
    scaled.width  = sanitize_span(vp.width  / factor);
    scaled.height = sanitize_span(vp.height / factor);

    // Shift so `anchor` lands back under (px, py).
    const PlanePoint moved = pixel_to_plane(scaled, px, py, canvas.width, canvas.height);
    return finish(vp.center_re + (anchor.re - moved.re),
                  vp.center_im + (anchor.im - moved.im),
                  scaled.width, scaled.height, vp);
}

Viewport pan_by_pixels(const Viewport& vp, double dx, double dy,
                       const CanvasSize& canvas)
{
    const double re_per_px = vp.width  / canvas.width;
    const double im_per_px = vp.height / canvas.height;
    return finish(vp.center_re - dx * re_per_px,
                  vp.center_im + dy * im_per_px,
                  vp.width, vp.height, vp);
}

double ease_in_out_quad(double t)
{
    const double c = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
    return c < 0.5 ? 2.0 * c * c : -1.0 + (4.0 - 2.0 * c) * c;
}

Viewport interpolate_viewport(const Viewport& from, const Viewport& to,
                              double aspect_ratio, double e)
{
    const double aspect = sanitize_aspect(aspect_ratio);
    const double width  = from.width + (to.width - from.width) * e;
    return finish(from.center_re + (to.center_re - from.center_re) * e,
                  from.center_im + (to.center_im - from.center_im) * e,
                  width, width / aspect, from);
}
