#pragma once

// Plane <-> pixel geometry. Pixel space has its origin at the top-left with y
// growing downward; the imaginary axis grows upward.

struct Viewport {
    double center_re = -0.5;
    double center_im =  0.0;
    double width     =  3.15;  // plane units spanned horizontally
    double height    =  3.15;
};

struct PixelRect {
    double x      = 0.0;
    double y      = 0.0;
    double width  = 0.0;
    double height = 0.0;
};

struct CanvasSize {
    double width  = 0.0;
    double height = 0.0;
};

struct PlanePoint {
    double re = 0.0;
    double im = 0.0;
};

struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

struct ViewportBounds {
    double left   = 0.0;
    double right  = 0.0;
    double top    = 0.0;   // larger imaginary value
    double bottom = 0.0;
};

// Home view reference: the canonical set extent is 3 plane units on both
// axes ([-2,1] x [-1.5,1.5]) plus 5% padding.
constexpr double HOME_TARGET_SPAN = 3.0;
constexpr double HOME_PADDING     = 1.05;
constexpr double HOME_SPAN        = HOME_TARGET_SPAN * HOME_PADDING;
constexpr double HOME_CENTER_RE   = -0.5;
constexpr double HOME_CENTER_IM   =  0.0;

inline Viewport create_viewport(double center_re, double center_im,
                                double width, double height)
{
    return Viewport{center_re, center_im, width, height};
}

inline bool operator==(const Viewport& a, const Viewport& b)
{
    return a.center_re == b.center_re && a.center_im == b.center_im &&
           a.width     == b.width     && a.height    == b.height;
}

inline bool operator!=(const Viewport& a, const Viewport& b) { return !(a == b); }

PlanePoint pixel_to_plane(const Viewport& vp, double px, double py,
                          double canvas_w, double canvas_h);

PixelPoint plane_to_pixel(const Viewport& vp, double re, double im,
                          double canvas_w, double canvas_h);

ViewportBounds viewport_bounds(const Viewport& vp);

// HOME_SPAN / min(width, height). ~1.0 for the home view; stays finite for
// any positive span, subnormals included.
double zoom_factor(const Viewport& vp);

// Home view for a canvas of the given aspect ratio (width / height). The
// narrower axis always covers at least HOME_TARGET_SPAN, padded.
Viewport reset_viewport(double aspect_ratio);

// width / height, or 1.0 when the canvas has no usable height.
double aspect_ratio(const CanvasSize& canvas);

bool viewport_is_valid(const Viewport& vp);
