#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Colour ramps are built from control points into an RGBA byte table
// (4 bytes per entry) and sampled with a normalized escape value t in [0,1].

static constexpr int PALETTE_STEPS = 256;

struct Rgb { float r, g, b; };   // 0-1

struct PaletteDefinition {
    std::string      name;     // display name
    std::vector<Rgb> colors;
};

// Registry keys in registration order: classic, viridis, inferno, ice, sunset,
// then anything added with add_palette().
std::vector<std::string> palette_names();
bool                     has_palette(const std::string& key);
std::string              palette_display_name(const std::string& key);

// Registers or replaces a ramp. Not synchronized: call before rendering starts.
void add_palette(const std::string& key, std::vector<Rgb> colors);

// Unknown keys fall back to "classic".
std::vector<uint8_t> generate_palette(const std::string& key,
                                      int steps = PALETTE_STEPS, double gamma = 1.0);

// Per-channel c^(1/gamma); alpha untouched.
std::vector<uint8_t> apply_gamma(const std::vector<uint8_t>& table, double gamma);

// RGBA 0-1 at t (clamped to [0,1]).
std::array<float, 4> sample_palette(const std::vector<uint8_t>& table, double t);

// Packed as 0xAABBGGRR so the bytes in memory read R, G, B, A.
inline uint32_t pack_rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
{
    return (static_cast<uint32_t>(a) << 24)
         | (static_cast<uint32_t>(b) << 16)
         | (static_cast<uint32_t>(g) <<  8)
         |  static_cast<uint32_t>(r);
}

inline uint32_t pack_rgb(const std::array<float, 3>& c)
{
    auto ch = [](float v) {
        const float cl = v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
        return static_cast<uint8_t>(cl * 255.0f + 0.5f);
    };
    return pack_rgba(ch(c[0]), ch(c[1]), ch(c[2]));
}

// Packed lookup table for the pixel loop.
class ColorRamp {
public:
    ColorRamp() { load("classic", 1.0); }

    void load(const std::string& key, double gamma);

    const std::string& key()   const { return ramp_key; }
    double             gamma() const { return ramp_gamma; }

    uint32_t shade(double t) const
    {
        const double cl  = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
        const size_t idx = static_cast<size_t>(cl * static_cast<double>(lut.size() - 1));
        return lut[idx];
    }

private:
    std::vector<uint32_t> lut;
    std::string           ramp_key;
    double                ramp_gamma = 1.0;
};
