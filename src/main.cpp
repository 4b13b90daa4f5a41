#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "ui_panels.hpp"
#include "zoom_planner.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

// Keep the view's width when the canvas changes shape; the height follows.
static Viewport refit_viewport(const Viewport& vp, const CanvasSize& canvas)
{
    Viewport out = vp;
    out.height = vp.width / aspect_ratio(canvas);
    return out;
}

// ---------------------------------------------------------------------------
// Canvas pointer handling: raw ImGui mouse state -> CanvasInput events
// ---------------------------------------------------------------------------
static void handle_canvas_input(AppState& app, const ImGuiIO& io,
                                float render_x, float render_y, bool hovered)
{
    const double mx = io.MousePos.x - render_x;
    const double my = io.MousePos.y - render_y;

    if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        app.input.pointer_down(mx, my);
        return;
    }
    if (app.input.pressed() && ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
        app.input.pointer_up(mx, my);
        return;
    }

    static bool was_hovered = false;
    if (hovered || app.input.pressed()) {
        if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f || !was_hovered)
            app.input.pointer_move(mx, my);
    } else if (was_hovered) {
        app.input.pointer_leave();
    }
    was_hovered = hovered;

    // Mouse wheel zoom (centered on cursor)
    if (hovered && io.MouseWheel != 0.0f && !app.input.pressed()) {
        const double factor = (io.MouseWheel > 0.0f) ? 1.25 : (1.0 / 1.25);
        const Viewport next = zoom_about_pixel(app.history.current(), mx, my, app.canvas, factor);
        app.history.push(next);
        app.scheduler.begin_interaction();
        app.scheduler.request_render(next, app.settings);
        app.scheduler.end_interaction();
    }
}

// Arrow keys pan by 10% of the canvas, +/- zoom about the center.
static void handle_keyboard(AppState& app, const ImGuiIO& io)
{
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S)) open_export_dialog(app);
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_Z)) undo_view(app);
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_Y)) redo_view(app);
    if (ImGui::IsKeyPressed(ImGuiKey_F1))              app.show_about = true;
    if (io.WantTextInput || io.KeyCtrl)
        return;

    if (ImGui::IsKeyPressed(ImGuiKey_H))
        go_home(app);

    const Viewport& vp = app.history.current();
    const double    dx = app.canvas.width  * 0.1;
    const double    dy = app.canvas.height * 0.1;
    if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow,  true)) navigate_to(app, pan_by_pixels(vp,  dx, 0.0, app.canvas));
    if (ImGui::IsKeyPressed(ImGuiKey_RightArrow, true)) navigate_to(app, pan_by_pixels(vp, -dx, 0.0, app.canvas));
    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow,    true)) navigate_to(app, pan_by_pixels(vp, 0.0,  dy, app.canvas));
    if (ImGui::IsKeyPressed(ImGuiKey_DownArrow,  true)) navigate_to(app, pan_by_pixels(vp, 0.0, -dy, app.canvas));

    const double cx = app.canvas.width  * 0.5;
    const double cy = app.canvas.height * 0.5;
    if (ImGui::IsKeyPressed(ImGuiKey_Equal) || ImGui::IsKeyPressed(ImGuiKey_KeypadAdd))
        navigate_to(app, zoom_about_pixel(vp, cx, cy, app.canvas, 1.5));
    if (ImGui::IsKeyPressed(ImGuiKey_Minus) || ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract))
        navigate_to(app, zoom_about_pixel(vp, cx, cy, app.canvas, 1.0 / 1.5));
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    spdlog::cfg::load_env_levels("MANDELNAV_LOG_LEVEL");

    int win_w0 = 1280, win_h0 = 720;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--width")  win_w0 = std::max(320, std::atoi(argv[++i]));
        else if (std::string(argv[i]) == "--height") win_h0 = std::max(240, std::atoi(argv[++i]));
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        spdlog::error("SDL_Init error: {}", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "Mandel Navigator",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        win_w0, win_h0,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        spdlog::error("SDL_CreateWindow error: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        spdlog::error("SDL_GL_CreateContext error: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    // -----------------------------------------------------------------------
    // App state
    // -----------------------------------------------------------------------
    auto app_ptr = std::make_unique<AppState>();
    AppState& app = *app_ptr;
    app.clock.advance(static_cast<double>(SDL_GetTicks64()));
    app.scheduler.set_stats_listener([&app](const RenderStats& s) {
        app.stats       = s;
        app.frame_ready = true;
    });
    app.input.set_on_commit([&app](const Viewport& vp) { app.history.push(vp); });

    bool initial_view = false;

    auto update_title = [&]() {
        char tbuf[128];
        std::snprintf(tbuf, sizeof(tbuf), "Mandel Navigator  [zoom: %.2fx]",
                      zoom_factor(app.history.current()));
        SDL_SetWindowTitle(window, tbuf);
    };

    bool running = true;
    while (running) {
        // Block until an event arrives; while the scheduler has frames or
        // timers pending, only for one display frame.
        const int wait_ms = app.clock.pending() > 0 ? 8 : 50;
        SDL_Event event;
        if (SDL_WaitEventTimeout(&event, wait_ms)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        int win_w, win_h;
        SDL_GetWindowSize(window, &win_w, &win_h);
        const float fw       = static_cast<float>(win_w);
        const float fh       = static_cast<float>(win_h);
        const float menu_h   = ImGui::GetFrameHeight();
        const float render_x = PANEL_WIDTH;
        const float render_y = menu_h;
        const float render_w = fw - PANEL_WIDTH;
        const float render_h = fh - menu_h - STATUS_HEIGHT;
        const int   irw      = static_cast<int>(render_w);
        const int   irh      = static_cast<int>(render_h);

        // Canvas resize: first view is the home view for this aspect,
        // later resizes keep the width and refit the height.
        if (irw > 0 && irh > 0 &&
            (irw != app.renderer.buffer().width || irh != app.renderer.buffer().height)) {
            app.renderer.resize(irw, irh);
            app.canvas = CanvasSize{static_cast<double>(irw), static_cast<double>(irh)};
            if (!initial_view) {
                app.history.set(reset_viewport(aspect_ratio(app.canvas)));
                initial_view = true;
            } else {
                app.history.set(refit_viewport(app.history.current(), app.canvas));
            }
            app.scheduler.request_render(app.history.current(), app.settings);
        }
        app.input.set_view(app.history.current(), app.settings, app.canvas);

        running = draw_menu_bar(app) && running;
        if (initial_view) handle_keyboard(app, io);
        draw_side_panel(app, io, menu_h, fh);

        // -------------------------------------------------------------------
        // Render area
        // -------------------------------------------------------------------
        ImGui::SetNextWindowPos(ImVec2(render_x, render_y));
        ImGui::SetNextWindowSize(ImVec2(render_w, render_h));
        ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
        ImGui::Begin("##render", nullptr,
            ImGuiWindowFlags_NoTitleBar            |
            ImGuiWindowFlags_NoResize              |
            ImGuiWindowFlags_NoMove                |
            ImGuiWindowFlags_NoBringToFrontOnFocus |
            ImGuiWindowFlags_NoScrollbar           |
            ImGuiWindowFlags_NoScrollWithMouse);
        ImGui::PopStyleVar();

        if (initial_view)
            handle_canvas_input(app, io, render_x, render_y, ImGui::IsWindowHovered());

        // Frame callbacks and timers due by now draw here.
        app.clock.advance(static_cast<double>(SDL_GetTicks64()));

        if (app.frame_ready) {
            app.render_tex.upload(app.renderer.buffer());
            app.frame_ready = false;
            update_title();
        }
        if (app.render_tex.id)
            ImGui::Image(app.render_tex.imgui_id(),
                         ImVec2(static_cast<float>(app.render_tex.w),
                                static_cast<float>(app.render_tex.h)));

        // Zoom selection overlay
        if (const auto& sel = app.input.selection()) {
            const ImVec2 a(render_x + static_cast<float>(sel->x),
                           render_y + static_cast<float>(sel->y));
            const ImVec2 b(a.x + static_cast<float>(sel->width),
                           a.y + static_cast<float>(sel->height));
            ImDrawList* dl = ImGui::GetWindowDrawList();
            dl->AddRectFilled(a, b, IM_COL32(255, 255, 255, 20));
            dl->AddRect(a, b, IM_COL32(255, 255, 255, 200), 0.0f, 0, 1.5f);
        }

        ImGui::End();  // ##render

        draw_status_bar(app, fw, fh);
        draw_export_dialog(app);
        draw_about_dialog(app);

        // -------------------------------------------------------------------
        // Render
        // -------------------------------------------------------------------
        ImGui::Render();
        glViewport(0, 0, win_w, win_h);
        glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    app.scheduler.cancel();
    app_ptr.reset();   // GL textures go before the context

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
