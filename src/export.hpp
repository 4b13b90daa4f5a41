#pragma once

#include "renderer.hpp"

#include <string>

struct Viewport;
struct RenderSettings;

// Both return an empty string on success, or an error message on failure.

// Writes `buf` as 8-bit RGBA. When `vp` is given the view is recorded in a
// tEXt chunk ("Comment") so the image can be traced back to its location.
std::string export_png(const std::string& path, const PixelBuffer& buf,
                       const Viewport* vp = nullptr);

// Renders `vp` off-screen at width x height (full quality, no progressive
// pass) and writes it to `path`.
std::string export_view_png(const std::string& path, const Viewport& vp,
                            const RenderSettings& settings, int width, int height);

// "center=<re>,<im> span=<w>x<h>"
std::string describe_view(const Viewport& vp);
