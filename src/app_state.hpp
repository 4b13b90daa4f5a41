#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "canvas_input.hpp"
#include "cpu_renderer.hpp"
#include "frame_clock.hpp"
#include "render_scheduler.hpp"
#include "render_settings.hpp"
#include "renderer.hpp"
#include "view_history.hpp"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// GL texture helper
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    void ensure(int nw, int nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, nw, nh, 0,
                     GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    void upload(const PixelBuffer& buf) {
        ensure(buf.width, buf.height);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGBA, GL_UNSIGNED_BYTE, buf.pixels.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    CpuRenderer     renderer;
    LoopClock       clock;
    RenderScheduler scheduler{renderer, clock};
    CanvasInput     input{scheduler};
    ViewHistory     history;
    RenderSettings  settings;

    RenderStats stats;
    bool        frame_ready = false;   // renderer drew since the last upload
    CanvasSize  canvas;                // render area in pixels

    // Dialog flags
    bool        show_about  = false;
    bool        show_export = false;

    // Export dialog state
    int         exp_scale    = 1;      // 0=1x, 1=2x, 2=4x, 3=custom
    int         exp_custom_w = 3840;
    int         exp_custom_h = 2160;
    bool        exp_done     = false;
    std::string exp_msg;
    std::string exp_saved_name;

    // Thread count selector (0 = Auto)
    int thread_sel = 0;

    GlTex render_tex;

    AppState()                           = default;
    AppState(const AppState&)            = delete;
    AppState& operator=(const AppState&) = delete;
};

// Navigation helpers shared by the menu, the keyboard shortcuts and the panel.
// Each one records the new view and asks the scheduler to draw it.
void navigate_to(AppState& app, const Viewport& vp);
void go_home(AppState& app);
void undo_view(AppState& app);
void redo_view(AppState& app);
// Settings edits are debounced: sliders fire every frame while dragged.
void settings_changed(AppState& app);
