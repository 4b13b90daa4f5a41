#pragma once

#include "viewport.hpp"

// Gesture -> new Viewport. Every result has a finite center and a strictly
// positive, finite span; degenerate input collapses to the smallest positive
// span instead of producing NaN/Inf.

// Zoom into a pixel-space selection. The result's aspect ratio is the
// canvas's, not the selection's: sizing is driven by width when the
// selection is relatively wider than the canvas, by height otherwise.
Viewport zoom_to_rect(const Viewport& vp, const PixelRect& rect,
                      const CanvasSize& canvas);

// Click zoom: shrink width by `factor`, recenter on `target`.
Viewport zoom_toward_point(const Viewport& vp, PlanePoint target,
                           double factor, double aspect_ratio);

// Continuous hold zoom: width = start.width * exp(-rate * t). The center
// snaps to the target immediately; only the span animates.
Viewport hold_zoom_trajectory(const Viewport& start, PlanePoint target,
                              double aspect_ratio, double elapsed_seconds,
                              double rate_per_second);

// Mouse wheel zoom keeping the plane point under (px, py) fixed.
Viewport zoom_about_pixel(const Viewport& vp, double px, double py,
                          const CanvasSize& canvas, double factor);

// Translate the view so the content follows a pointer moved by (dx, dy).
Viewport pan_by_pixels(const Viewport& vp, double dx, double dy,
                       const CanvasSize& canvas);

// Smallest positive span substituted for zero / negative / non-finite spans.
double sanitize_span(double span);

// easeInOutQuad: 2t^2 below t = 0.5, -1 + (4 - 2t)t above. t is clamped to [0,1].
double ease_in_out_quad(double t);

// Blend of two views at progress `e`: centers and widths are interpolated,
// height follows width through `aspect_ratio`.
Viewport interpolate_viewport(const Viewport& from, const Viewport& to,
                              double aspect_ratio, double e);
