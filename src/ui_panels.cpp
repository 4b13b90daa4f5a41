#include "ui_panels.hpp"
#include "app_state.hpp"
#include "export.hpp"
#include "palette.hpp"
#include "viewport.hpp"
#include "imgui.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------
void navigate_to(AppState& app, const Viewport& vp)
{
    app.history.push(vp);
    app.scheduler.request_render(app.history.current(), app.settings);
}

void go_home(AppState& app)
{
    app.history.reset(aspect_ratio(app.canvas));
    app.scheduler.request_render(app.history.current(), app.settings);
}

void undo_view(AppState& app)
{
    if (app.history.undo())
        app.scheduler.request_render(app.history.current(), app.settings);
}

void redo_view(AppState& app)
{
    if (app.history.redo())
        app.scheduler.request_render(app.history.current(), app.settings);
}

void settings_changed(AppState& app)
{
    app.scheduler.request_render(app.history.current(), app.settings, true);
}

// ---------------------------------------------------------------------------
// Menu bar: file, view history, threads, help
// ---------------------------------------------------------------------------
bool draw_menu_bar(AppState& app)
{
    bool keep_running = true;
    if (!ImGui::BeginMainMenuBar())
        return keep_running;

    if (ImGui::BeginMenu("File")) {
        if (ImGui::MenuItem("Save PNG...", "Ctrl+S"))
            open_export_dialog(app);
        ImGui::Separator();
        if (ImGui::MenuItem("Exit")) keep_running = false;
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("View")) {
        if (ImGui::MenuItem("Home", "H"))
            go_home(app);
        ImGui::Separator();
        if (ImGui::MenuItem("Undo", "Ctrl+Z", false, app.history.can_undo()))
            undo_view(app);
        if (ImGui::MenuItem("Redo", "Ctrl+Y", false, app.history.can_redo()))
            redo_view(app);
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("Threads")) {
        const int hw = app.renderer.hw_concurrency;
        char buf[32];
        snprintf(buf, sizeof(buf), "Auto (%d)", hw);
        if (ImGui::MenuItem(buf, nullptr, app.thread_sel == 0)) {
            app.thread_sel = 0;
            app.renderer.set_thread_count(0);
        }
        ImGui::Separator();
        for (int i = 1; i <= hw; ++i) {
            snprintf(buf, sizeof(buf), "%d", i);
            if (ImGui::MenuItem(buf, nullptr, app.thread_sel == i)) {
                app.thread_sel = i;
                app.renderer.set_thread_count(i);
            }
        }
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("Help")) {
        if (ImGui::MenuItem("About", "F1")) app.show_about = true;
        ImGui::EndMenu();
    }
    ImGui::EndMainMenuBar();
    return keep_running;
}

// ---------------------------------------------------------------------------
// Side panel: view, color, performance
// ---------------------------------------------------------------------------
void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh)
{
    RenderSettings& s = app.settings;
    bool changed = false;

    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    // --- View ---
    ImGui::TextDisabled("VIEW");
    ImGui::Separator();
    {
        ImGui::Text("Max iterations");
        ImGui::SetNextItemWidth(-1.0f);
        changed |= ImGui::SliderInt("##iter", &s.max_iterations, 16, 2048, "%d",
                                    ImGuiSliderFlags_Logarithmic);

        ImGui::Spacing();
        changed |= ImGui::Checkbox("Progressive refinement", &s.progressive_refinement);
        ImGui::TextDisabled("Refine quality after interaction");
        changed |= ImGui::Checkbox("Reduce quality while dragging",
                                   &s.reduce_quality_while_dragging);

        ImGui::Spacing();
        ImGui::Text("Click zoom factor");
        static const double zoom_min = 1.2, zoom_max = 5.0;
        ImGui::SetNextItemWidth(-1.0f);
        ImGui::SliderScalar("##zoomf", ImGuiDataType_Double, &s.zoom_factor,
                            &zoom_min, &zoom_max, "%.1fx");

        ImGui::Spacing();
        if (ImGui::Button("Home", ImVec2(-1.0f, 0.0f)))
            go_home(app);
    }

    // --- Color ---
    ImGui::Spacing();
    ImGui::TextDisabled("COLOR");
    ImGui::Separator();
    {
        const std::vector<std::string> keys = palette_names();
        int sel = 0;
        for (size_t i = 0; i < keys.size(); ++i)
            if (keys[i] == s.palette) sel = static_cast<int>(i);

        ImGui::Text("Palette");
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::BeginCombo("##palette", palette_display_name(s.palette).c_str())) {
            for (size_t i = 0; i < keys.size(); ++i) {
                const bool selected = static_cast<int>(i) == sel;
                if (ImGui::Selectable(palette_display_name(keys[i]).c_str(), selected)) {
                    s.palette = keys[i];
                    changed = true;
                }
                if (selected) ImGui::SetItemDefaultFocus();
            }
            ImGui::EndCombo();
        }
        if (ImGui::IsItemHovered() && io.MouseWheel != 0.0f && !keys.empty()) {
            const int n = static_cast<int>(keys.size());
            sel = (sel + (io.MouseWheel < 0.0f ? 1 : -1) + n) % n;
            s.palette = keys[sel];
            changed = true;
        }

        ImGui::Spacing();
        changed |= ImGui::Checkbox("Smooth coloring", &s.smooth_coloring);

        ImGui::Spacing();
        ImGui::Text("Gamma");
        static const double gamma_min = 0.1, gamma_max = 3.0;
        ImGui::SetNextItemWidth(-1.0f);
        changed |= ImGui::SliderScalar("##gamma", ImGuiDataType_Double, &s.gamma,
                                       &gamma_min, &gamma_max, "%.1f");

        ImGui::Spacing();
        ImGui::Text("Inside color");
        ImGui::SetNextItemWidth(-1.0f);
        changed |= ImGui::ColorEdit3("##inside", s.inside_color.data());

        ImGui::Spacing();
        ImGui::Text("Debug view");
        static const char* debug_names[] = { "None", "UV gradient", "Grayscale" };
        int dm = static_cast<int>(s.debug_mode);
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##debug", &dm, debug_names, DEBUG_MODE_COUNT)) {
            s.debug_mode = static_cast<DebugMode>(dm);
            changed = true;
        }
    }

    // --- Performance ---
    ImGui::Spacing();
    ImGui::TextDisabled("PERFORMANCE");
    ImGui::Separator();
    {
        ImGui::Text("Quality");
        const float bw = (ImGui::GetContentRegionAvail().x
                          - ImGui::GetStyle().ItemSpacing.x * (QUALITY_COUNT - 1)) / QUALITY_COUNT;
        for (int i = 0; i < QUALITY_COUNT; ++i) {
            const auto q = static_cast<QualityPreset>(i);
            if (i > 0) ImGui::SameLine();
            const bool active = s.quality == q;
            if (active)
                ImGui::PushStyleColor(ImGuiCol_Button, ImGui::GetStyleColorVec4(ImGuiCol_ButtonActive));
            if (ImGui::Button(quality_name(q), ImVec2(bw, 0.0f))) {
                s.quality        = q;
                s.max_iterations = quality_iterations(q);
                changed = true;
            }
            if (active)
                ImGui::PopStyleColor();
        }
    }

    ImGui::End();  // ##panel

    if (changed) {
        const std::string bad = validate_settings(s);
        if (bad.empty())
            settings_changed(app);
        else
            spdlog::warn("settings rejected: {}", bad);
    }
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(AppState& app, float fw, float fh)
{
    const Viewport&       vp = app.history.current();
    const RenderSettings& s  = app.settings;

    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();
    ImGui::Text("Zoom: %.1fx   Iterations: %d   Palette: %s   Mode: %s   Render: %.0f ms   %dx%d  [%dt]",
                zoom_factor(vp), s.max_iterations, s.palette.c_str(),
                s.smooth_coloring ? "Smooth" : "Discrete",
                app.stats.render_ms,
                static_cast<int>(app.canvas.width), static_cast<int>(app.canvas.height),
                app.renderer.thread_count);
    if (const auto& h = app.input.hover()) {
        ImGui::SameLine();
        ImGui::TextDisabled("   Re: %.6f Im: %.6f", h->re, h->im);
    }
    ImGui::End();
}

// ---------------------------------------------------------------------------
// Export dialog
// ---------------------------------------------------------------------------
void open_export_dialog(AppState& app)
{
    app.show_export = true;
    app.exp_done    = false;
    app.exp_msg.clear();
}

void draw_export_dialog(AppState& app)
{
    if (app.show_export) {
        ImGui::OpenPopup("Save PNG##dlg");
        app.show_export = false;
    }
    if (!ImGui::BeginPopupModal("Save PNG##dlg", nullptr,
                                ImGuiWindowFlags_AlwaysAutoResize))
        return;

    const int cw = static_cast<int>(app.canvas.width);
    const int ch = static_cast<int>(app.canvas.height);

    // Resolution selector
    ImGui::TextDisabled("RESOLUTION");
    ImGui::Separator();
    {
        char buf1[64], buf2[64], buf4[64];
        std::snprintf(buf1, sizeof(buf1), "1x   %d x %d", cw,     ch    );
        std::snprintf(buf2, sizeof(buf2), "2x   %d x %d", cw * 2, ch * 2);
        std::snprintf(buf4, sizeof(buf4), "4x   %d x %d", cw * 4, ch * 4);
        ImGui::RadioButton(buf1, &app.exp_scale, 0);
        ImGui::RadioButton(buf2, &app.exp_scale, 1);
        ImGui::RadioButton(buf4, &app.exp_scale, 2);
        ImGui::RadioButton("Custom", &app.exp_scale, 3);
        if (app.exp_scale == 3) {
            ImGui::SameLine();
            ImGui::SetNextItemWidth(80.0f);
            ImGui::InputInt("##cw", &app.exp_custom_w, 0);
            app.exp_custom_w = std::max(16, std::min(app.exp_custom_w, 7680));
            ImGui::SameLine(); ImGui::TextUnformatted("x");
            ImGui::SameLine();
            ImGui::SetNextItemWidth(80.0f);
            ImGui::InputInt("##ch", &app.exp_custom_h, 0);
            app.exp_custom_h = std::max(16, std::min(app.exp_custom_h, 4320));
        }
    }

    ImGui::Spacing();
    ImGui::TextDisabled("OUTPUT");
    ImGui::Separator();

    std::time_t t = std::time(nullptr);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", std::localtime(&t));
    const std::string filename = std::string("mandelbrot_") + ts + ".png";
    ImGui::Text("%s", app.exp_done ? app.exp_saved_name.c_str() : filename.c_str());

    if (!app.exp_done) {
        ImGui::Spacing();
        if (ImGui::Button("Save", ImVec2(120.0f, 0.0f))) {
            app.exp_saved_name = filename;
            int tw, th;
            switch (app.exp_scale) {
                case 0: tw = cw;     th = ch;     break;
                case 1: tw = cw * 2; th = ch * 2; break;
                case 2: tw = cw * 4; th = ch * 4; break;
                default: tw = app.exp_custom_w; th = app.exp_custom_h; break;
            }
            // Keep the on-screen framing: custom sizes refit the width.
            Viewport vp = app.history.current();
            vp.width = vp.height * (static_cast<double>(tw) / th);
            app.exp_msg  = export_view_png(app.exp_saved_name, vp, app.settings, tw, th);
            app.exp_done = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    } else {
        ImGui::Spacing();
        if (app.exp_msg.empty()) {
            ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f),
                               "Saved: %s", app.exp_saved_name.c_str());
        } else {
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f),
                               "Error: %s", app.exp_msg.c_str());
        }
        ImGui::Spacing();
        if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

// ---------------------------------------------------------------------------
// About dialog
// ---------------------------------------------------------------------------
void draw_about_dialog(AppState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (ImGui::BeginPopupModal("About##dlg", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Mandel Navigator");
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::Text("Click to zoom, hold to dive, drag a box to frame a region.");
        ImGui::Spacing();
        ImGui::TextDisabled("Progressive refinement: quick previews while moving,");
        ImGui::TextDisabled("full detail once the view settles");
        ImGui::TextDisabled("Ctrl+Z / Ctrl+Y  undo / redo    H  home");
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::TextDisabled("Built with Dear ImGui, SDL2, libpng, spdlog");
        ImGui::Spacing();
        ImGui::SetCursorPosX(
            (ImGui::GetContentRegionAvail().x - 120.0f) * 0.5f
            + ImGui::GetCursorPosX());
        if (ImGui::Button("Close", ImVec2(120.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}
