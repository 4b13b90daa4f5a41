#include "viewport.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

PlanePoint pixel_to_plane(const Viewport& vp, double px, double py,
                          double canvas_w, double canvas_h)
{
    const double nx = px / canvas_w;
    const double ny = py / canvas_h;
    return { vp.center_re - vp.width  * 0.5 + nx * vp.width,
             vp.center_im + vp.height * 0.5 - ny * vp.height };
}

PixelPoint plane_to_pixel(const Viewport& vp, double re, double im,
                          double canvas_w, double canvas_h)
{
    const double nx = (re - (vp.center_re - vp.width * 0.5)) / vp.width;
    const double ny = (vp.center_im + vp.height * 0.5 - im) / vp.height;
    return { nx * canvas_w, ny * canvas_h };
}

ViewportBounds viewport_bounds(const Viewport& vp)
{
    ViewportBounds b;
    b.left   = vp.center_re - vp.width  * 0.5;
    b.right  = vp.center_re + vp.width  * 0.5;
    b.top    = vp.center_im + vp.height * 0.5;
    b.bottom = vp.center_im - vp.height * 0.5;
    return b;
}

double zoom_factor(const Viewport& vp)
{
    const double visible = std::min(vp.width, vp.height);
    const double z       = HOME_SPAN / visible;
    // HOME_SPAN / denorm_min overflows; saturate instead.
    if (!std::isfinite(z))
        return std::numeric_limits<double>::max();
    return z;
}

Viewport reset_viewport(double aspect_ratio)
{
    const double width  = std::max(HOME_TARGET_SPAN, HOME_TARGET_SPAN * aspect_ratio)
                        * HOME_PADDING;
    const double height = width / aspect_ratio;
    return create_viewport(HOME_CENTER_RE, HOME_CENTER_IM, width, height);
}

double aspect_ratio(const CanvasSize& canvas)
{
    if (!(canvas.height > 0.0) || !(canvas.width > 0.0))
        return 1.0;
    return canvas.width / canvas.height;
}

bool viewport_is_valid(const Viewport& vp)
{
    return std::isfinite(vp.center_re) && std::isfinite(vp.center_im) &&
           std::isfinite(vp.width)     && std::isfinite(vp.height)    &&
           vp.width > 0.0 && vp.height > 0.0;
}
