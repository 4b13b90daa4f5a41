#pragma once

#include "render_scheduler.hpp"
#include "render_settings.hpp"
#include "viewport.hpp"

#include <functional>
#include <optional>

// Pointer gestures on the fractal canvas: press-and-hold zooms continuously,
// a short click animates a zoom toward the clicked point, a drag draws an
// aspect-locked selection that zooms into the rectangle on release.
//
// Coordinates are canvas pixels, origin top-left. The host keeps the view
// snapshot current with set_view() and receives every finished gesture's
// viewport through on_commit.
class CanvasInput {
public:
    struct Config {
        double drag_threshold_px = 8.0;    // movement that turns a press into a drag
        double min_selection_px  = 20.0;   // smaller selections count as clicks
    };

    using CommitFn = std::function<void(const Viewport&)>;

    CanvasInput(RenderScheduler& scheduler, Config config);
    explicit CanvasInput(RenderScheduler& scheduler) : CanvasInput(scheduler, Config{}) {}

    void set_view(const Viewport& vp, const RenderSettings& settings, CanvasSize canvas);
    void set_on_commit(CommitFn fn) { on_commit = std::move(fn); }

    void pointer_down(double x, double y);
    void pointer_move(double x, double y);
    void pointer_up(double x, double y);
    void pointer_leave();

    bool                             pressed()   const { return is_pressed; }
    bool                             dragged()   const { return did_drag; }
    const std::optional<PixelRect>&  selection() const { return sel; }
    // Plane point under the cursor; extrapolates outside the canvas.
    const std::optional<PlanePoint>& hover()     const { return hover_pt; }
    const Config&                    config()    const { return cfg; }

private:
    void commit(const Viewport& vp);
    void stop_hold();
    void clear_gesture();
    void update_selection(double x, double y);

    RenderScheduler& scheduler;
    Config           cfg;
    CommitFn         on_commit;

    Viewport       view;
    RenderSettings settings;
    CanvasSize     canvas = {1.0, 1.0};

    bool   is_pressed = false;
    bool   did_drag   = false;
    double start_x    = 0.0;
    double start_y    = 0.0;

    std::optional<PixelRect>  sel;
    std::optional<PlanePoint> hover_pt;
};
