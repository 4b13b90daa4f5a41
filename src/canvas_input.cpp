#include "canvas_input.hpp"
#include "zoom_planner.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>

CanvasInput::CanvasInput(RenderScheduler& scheduler_, Config config)
    : scheduler(scheduler_), cfg(config)
{
}

void CanvasInput::set_view(const Viewport& vp, const RenderSettings& s, CanvasSize c)
{
    view     = vp;
    settings = s;
    canvas   = c;
}

void CanvasInput::commit(const Viewport& vp)
{
    view = vp;
    if (on_commit)
        on_commit(vp);
}

void CanvasInput::stop_hold()
{
    scheduler.stop_hold_zoom(settings, [this](const Viewport& vp) { commit(vp); });
}

void CanvasInput::clear_gesture()
{
    is_pressed = false;
    did_drag   = false;
    sel.reset();
}

// ----------------------------------------------------------------------------

void CanvasInput::pointer_down(double x, double y)
{
    is_pressed = true;
    did_drag   = false;
    start_x    = x;
    start_y    = y;
    sel.reset();

    scheduler.begin_interaction();
    const PlanePoint target = pixel_to_plane(view, x, y, canvas.width, canvas.height);
    scheduler.arm_hold_zoom(view, settings, target, aspect_ratio(canvas));
}

void CanvasInput::pointer_move(double x, double y)
{
    hover_pt = pixel_to_plane(view, x, y, canvas.width, canvas.height);
    if (!is_pressed)
        return;

    const double dx = x - start_x;
    const double dy = y - start_y;
    if (std::fabs(dx) > cfg.drag_threshold_px || std::fabs(dy) > cfg.drag_threshold_px) {
        if (!did_drag) {
            did_drag = true;
            spdlog::debug("canvas: press became a drag at ({:.0f}, {:.0f})", x, y);
        }
        if (scheduler.phase() == InteractionPhase::HoldZooming) {
            stop_hold();
            scheduler.begin_interaction();
        }
        scheduler.cancel_hold_arm();
    }

    update_selection(x, y);
}

// Selection keeps the canvas aspect: whichever side is short relative to
// the other is stretched down to match, then the rect is normalised to a
// top-left origin and positive size.
void CanvasInput::update_selection(double x, double y)
{
    const double aspect = aspect_ratio(canvas);

    double w = x - start_x;
    double h = y - start_y;
    const double abs_w = std::fabs(w);
    const double abs_h = std::fabs(h);

    const double locked_h = abs_w / aspect;
    const double locked_w = abs_h * aspect;
    if (locked_h <= abs_h)
        h = std::copysign(locked_h, h);
    else
        w = std::copysign(locked_w, w);

    PixelRect r;
    r.x      = w >= 0.0 ? start_x : start_x + w;
    r.y      = h >= 0.0 ? start_y : start_y + h;
    r.width  = std::fabs(w);
    r.height = std::fabs(h);
    sel = r;
}

void CanvasInput::pointer_up(double x, double y)
{
    if (!is_pressed)
        return;

    scheduler.cancel_hold_arm();

    if (scheduler.phase() == InteractionPhase::HoldZooming) {
        stop_hold();
        clear_gesture();
        return;
    }

    const bool is_click = !sel
                       || sel->width  < cfg.min_selection_px
                       || sel->height < cfg.min_selection_px;
    if (is_click) {
        clear_gesture();
        scheduler.end_interaction();
        const PlanePoint target = pixel_to_plane(view, x, y, canvas.width, canvas.height);
        scheduler.animate_zoom(view, settings, target, aspect_ratio(canvas),
                               [this](const Viewport& vp) { commit(vp); });
        return;
    }

    const Viewport next = zoom_to_rect(view, *sel, canvas);
    clear_gesture();
    commit(next);
    scheduler.request_render(next, settings);
    scheduler.end_interaction();
}

void CanvasInput::pointer_leave()
{
    hover_pt.reset();
    if (!is_pressed)
        return;

    scheduler.cancel_hold_arm();
    if (scheduler.phase() == InteractionPhase::HoldZooming)
        stop_hold();
    clear_gesture();
    scheduler.end_interaction();
}
