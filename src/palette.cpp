#include "palette.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------
using Entry = std::pair<std::string, PaletteDefinition>;

static std::vector<Entry>& registry()
{
    static std::vector<Entry> entries = {
        {"classic", {"Classic HSV", {
            {0.00f, 0.00f, 0.00f},
            {0.25f, 0.00f, 1.00f},
            {0.50f, 1.00f, 1.00f},
            {1.00f, 1.00f, 0.00f},
            {1.00f, 0.00f, 0.00f},
        }}},
        {"viridis", {"Viridis", {
            {0.267004f, 0.004874f, 0.329415f},
            {0.282623f, 0.140461f, 0.469011f},
            {0.253935f, 0.265254f, 0.529983f},
            {0.206756f, 0.371758f, 0.553117f},
            {0.163625f, 0.471133f, 0.558375f},
            {0.127568f, 0.566949f, 0.550413f},
            {0.134692f, 0.658636f, 0.517649f},
            {0.266941f, 0.748751f, 0.440573f},
            {0.477504f, 0.821444f, 0.318195f},
            {0.741388f, 0.873449f, 0.149561f},
            {0.993248f, 0.906157f, 0.143936f},
        }}},
        {"inferno", {"Inferno", {
            {0.001462f, 0.000466f, 0.013866f},
            {0.010196f, 0.009137f, 0.142864f},
            {0.076352f, 0.038648f, 0.384014f},
            {0.352091f, 0.035010f, 0.531975f},
            {0.701640f, 0.278969f, 0.234710f},
            {0.941596f, 0.973281f, 0.131368f},
        }}},
        {"ice", {"Ice", {
            {0.0f, 0.0f, 0.0f},
            {0.0f, 0.5f, 1.0f},
            {0.5f, 0.8f, 1.0f},
            {1.0f, 1.0f, 1.0f},
        }}},
        {"sunset", {"Sunset", {
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {1.0f, 0.5f, 0.0f},
            {1.0f, 1.0f, 0.0f},
            {1.0f, 1.0f, 0.5f},
        }}},
    };
    return entries;
}

static const PaletteDefinition* find_palette(const std::string& key)
{
    for (const Entry& e : registry())
        if (e.first == key) return &e.second;
    return nullptr;
}

std::vector<std::string> palette_names()
{
    std::vector<std::string> names;
    names.reserve(registry().size());
    for (const Entry& e : registry()) names.push_back(e.first);
    return names;
}

bool has_palette(const std::string& key)
{
    return find_palette(key) != nullptr;
}

std::string palette_display_name(const std::string& key)
{
    const PaletteDefinition* def = find_palette(key);
    return def ? def->name : key;
}

void add_palette(const std::string& key, std::vector<Rgb> colors)
{
    for (Entry& e : registry()) {
        if (e.first == key) {
            e.second.colors = std::move(colors);
            return;
        }
    }
    registry().push_back({key, {key, std::move(colors)}});
}

// ---------------------------------------------------------------------------
// Table generation
// ---------------------------------------------------------------------------
static uint8_t to_byte(float v)
{
    return static_cast<uint8_t>(std::lround(std::max(0.0f, std::min(1.0f, v)) * 255.0f));
}

// Equal-width segments between consecutive control points; entries left over
// by the integer division take the final colour.
static std::vector<uint8_t> interpolate_colors(const std::vector<Rgb>& colors, int steps)
{
    std::vector<uint8_t> table(static_cast<size_t>(steps) * 4, 255);
    if (colors.empty() || steps <= 0) return table;

    int index = 0;
    if (colors.size() > 1) {
        const int segments      = static_cast<int>(colors.size()) - 1;
        const int segment_steps = steps / segments;
        for (int s = 0; s < segments; ++s) {
            const Rgb& a = colors[s];
            const Rgb& b = colors[s + 1];
            for (int j = 0; j < segment_steps && index < steps; ++j, ++index) {
                const float t = static_cast<float>(j) / static_cast<float>(segment_steps);
                uint8_t* px = &table[static_cast<size_t>(index) * 4];
                px[0] = to_byte((1.0f - t) * a.r + t * b.r);
                px[1] = to_byte((1.0f - t) * a.g + t * b.g);
                px[2] = to_byte((1.0f - t) * a.b + t * b.b);
            }
        }
    }

    const Rgb& last = colors.back();
    for (; index < steps; ++index) {
        uint8_t* px = &table[static_cast<size_t>(index) * 4];
        px[0] = to_byte(last.r);
        px[1] = to_byte(last.g);
        px[2] = to_byte(last.b);
    }
    return table;
}

std::vector<uint8_t> apply_gamma(const std::vector<uint8_t>& table, double gamma)
{
    std::vector<uint8_t> out(table.size());
    const double inv = 1.0 / gamma;
    for (size_t i = 0; i + 3 < table.size(); i += 4) {
        for (size_t c = 0; c < 3; ++c) {
            const double v = std::pow(table[i + c] / 255.0, inv);
            out[i + c] = static_cast<uint8_t>(std::lround(v * 255.0));
        }
        out[i + 3] = table[i + 3];
    }
    return out;
}

std::vector<uint8_t> generate_palette(const std::string& key, int steps, double gamma)
{
    const PaletteDefinition* def = find_palette(key);
    if (!def) def = find_palette("classic");

    std::vector<uint8_t> table = interpolate_colors(def->colors, steps);
    if (gamma != 1.0)
        table = apply_gamma(table, gamma);
    return table;
}

std::array<float, 4> sample_palette(const std::vector<uint8_t>& table, double t)
{
    const size_t steps = table.size() / 4;
    if (steps == 0) return {0.0f, 0.0f, 0.0f, 0.0f};

    const double cl  = std::max(0.0, std::min(1.0, t));
    const size_t idx = static_cast<size_t>(std::floor(cl * static_cast<double>(steps - 1))) * 4;
    return { table[idx]     / 255.0f, table[idx + 1] / 255.0f,
             table[idx + 2] / 255.0f, table[idx + 3] / 255.0f };
}

// ---------------------------------------------------------------------------
// ColorRamp
// ---------------------------------------------------------------------------
void ColorRamp::load(const std::string& key, double gamma)
{
    const std::vector<uint8_t> table = generate_palette(key, PALETTE_STEPS, gamma);
    lut.resize(table.size() / 4);
    for (size_t i = 0; i < lut.size(); ++i)
        lut[i] = pack_rgba(table[i*4], table[i*4 + 1], table[i*4 + 2], table[i*4 + 3]);
    ramp_key   = key;
    ramp_gamma = gamma;
}
