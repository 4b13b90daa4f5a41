#include "render_settings.hpp"
#include "palette.hpp"

#include <algorithm>
#include <cmath>

int quality_iterations(QualityPreset q)
{
    switch (q) {
        case QualityPreset::Low:    return 64;
        case QualityPreset::Medium: return 128;
        case QualityPreset::High:   return 256;
        case QualityPreset::Ultra:  return 512;
    }
    return 256;
}

int progressive_iterations(QualityPreset q, bool interactive)
{
    const int base = quality_iterations(q);
    if (!interactive)
        return base;
    return std::max(MIN_INTERACTIVE_ITERATIONS, base / INTERACTIVE_DIVISOR);
}

const char* quality_name(QualityPreset q)
{
    switch (q) {
        case QualityPreset::Low:    return "low";
        case QualityPreset::Medium: return "medium";
        case QualityPreset::High:   return "high";
        case QualityPreset::Ultra:  return "ultra";
    }
    return "high";
}

bool parse_quality(const std::string& name, QualityPreset& out)
{
    for (int i = 0; i < QUALITY_COUNT; ++i) {
        const auto q = static_cast<QualityPreset>(i);
        if (name == quality_name(q)) { out = q; return true; }
    }
    return false;
}

const char* debug_mode_name(DebugMode m)
{
    switch (m) {
        case DebugMode::None:      return "none";
        case DebugMode::Gradient:  return "gradient";
        case DebugMode::Grayscale: return "grayscale";
    }
    return "none";
}

bool parse_debug_mode(const std::string& name, DebugMode& out)
{
    for (int i = 0; i < DEBUG_MODE_COUNT; ++i) {
        const auto m = static_cast<DebugMode>(i);
        if (name == debug_mode_name(m)) { out = m; return true; }
    }
    return false;
}

std::string validate_settings(const RenderSettings& s)
{
    if (s.max_iterations <= 0)
        return "max_iterations must be positive";
    if (!std::isfinite(s.gamma) || s.gamma <= 0.0)
        return "gamma must be a positive number";
    if (!std::isfinite(s.zoom_factor) || s.zoom_factor <= 1.0)
        return "zoom_factor must be greater than 1";
    for (float c : s.inside_color)
        if (!(c >= 0.0f && c <= 1.0f))
            return "inside_color components must lie in [0, 1]";
    if (!has_palette(s.palette))
        return "unknown palette: " + s.palette;
    return {};
}

RenderSettings with_iterations(const RenderSettings& s, int max_iterations)
{
    RenderSettings out  = s;
    out.max_iterations  = max_iterations;
    return out;
}
