#pragma once

#include <array>
#include <string>

enum class QualityPreset {
    Low    = 0,
    Medium = 1,
    High   = 2,
    Ultra  = 3,
};
constexpr int QUALITY_COUNT = 4;

enum class DebugMode {
    None      = 0,
    Gradient  = 1,   // UV passthrough, checks the pixel mapping
    Grayscale = 2,   // normalized escape value without the palette
};
constexpr int DEBUG_MODE_COUNT = 3;

// Snapshot handed to the scheduler with every request; never mutated once a
// request has been issued.
struct RenderSettings {
    int                   max_iterations                = 256;
    bool                  smooth_coloring               = true;
    double                gamma                         = 1.0;
    std::array<float, 3>  inside_color                  = {0.25f, 1.0f, 0.1f};  // RGB 0-1
    std::string           palette                       = "classic";
    QualityPreset         quality                       = QualityPreset::High;
    bool                  progressive_refinement        = true;
    bool                  reduce_quality_while_dragging = true;
    DebugMode             debug_mode                    = DebugMode::None;
    double                zoom_factor                   = 2.0;  // click-to-zoom multiplier
};

// Interactive frames use a quarter of the preset budget, never below this.
constexpr int MIN_INTERACTIVE_ITERATIONS = 32;
constexpr int INTERACTIVE_DIVISOR        = 4;

// low=64, medium=128, high=256, ultra=512
int quality_iterations(QualityPreset q);

// base, or max(32, base/4) while interacting.
int progressive_iterations(QualityPreset q, bool interactive);

const char*   quality_name(QualityPreset q);
// Case-sensitive; returns false and leaves `out` untouched on unknown names.
bool          parse_quality(const std::string& name, QualityPreset& out);

const char*   debug_mode_name(DebugMode m);
bool          parse_debug_mode(const std::string& name, DebugMode& out);

// Empty string when the settings are usable, otherwise what is wrong.
std::string validate_settings(const RenderSettings& s);

RenderSettings with_iterations(const RenderSettings& s, int max_iterations);
