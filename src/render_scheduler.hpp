#pragma once

#include "frame_clock.hpp"
#include "render_settings.hpp"
#include "renderer.hpp"
#include "viewport.hpp"

#include <functional>
#include <optional>
#include <string>

enum class InteractionPhase {
    Idle,
    Dragging,
    Animating,
    HoldZooming,
    Settling,
};

const char* phase_name(InteractionPhase p);

struct SchedulerConfig {
    double settle_delay_ms = 200.0;   // quiet time before the full-quality pass
    double animation_ms    = 450.0;   // click-zoom duration
    double hold_delay_ms   = 200.0;   // press time before hold-zoom starts
    double hold_rate_per_s = 1.6;     // exponential shrink rate while held
};

// One draw call. `iterations_override` replaces settings.max_iterations for
// reduced-quality frames.
struct RenderRequest {
    Viewport            viewport;
    RenderSettings      settings;
    std::optional<int>  iterations_override;
};

// Interactive requests drop to progressive_iterations(quality, true).
// Animation and hold-zoom frames are always interactive; drag previews only
// when settings.reduce_quality_while_dragging is set.
RenderRequest make_render_request(const Viewport& vp, const RenderSettings& s,
                                  bool interactive);

// Turns interaction events into draw calls on a RenderSurface.
//
// At most one timing source drives renders at any moment: the settle timer,
// the hold-zoom arm timer, or the per-frame loop of an animation / hold-zoom.
// Entering any phase first cancels that driver, so a stale low-quality frame
// can never land after a fresh full-quality one. Callbacks that fire for a
// driver that has since been replaced are ignored.
//
// Single-threaded: every method and every clock callback must run on the
// thread that owns the FrameClock.
class RenderScheduler {
public:
    using CompletionFn = std::function<void(const Viewport&)>;
    using StatsFn      = std::function<void(const RenderStats&)>;

    RenderScheduler(RenderSurface& surface, FrameClock& clock,
                    SchedulerConfig config = SchedulerConfig{});
    ~RenderScheduler();

    RenderScheduler(const RenderScheduler&)            = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    void begin_interaction();
    void end_interaction();

    void request_render(const Viewport& vp, const RenderSettings& settings,
                        bool debounce = false);

    // Eased zoom by settings.zoom_factor toward `target`. on_complete gets the
    // final viewport after its full-quality draw.
    void animate_zoom(const Viewport& start, const RenderSettings& settings,
                      PlanePoint target, double aspect_ratio,
                      CompletionFn on_complete = {});

    // Starts a hold-zoom after config().hold_delay_ms unless canceled first.
    void arm_hold_zoom(const Viewport& vp, const RenderSettings& settings,
                       PlanePoint target, double aspect_ratio);
    // True if an arm was pending.
    bool cancel_hold_arm();

    void start_hold_zoom(const Viewport& vp, const RenderSettings& settings,
                         PlanePoint target, double aspect_ratio);
    // False (and no callback) when no hold-zoom is running.
    bool stop_hold_zoom(const RenderSettings& settings, CompletionFn on_complete = {});

    // Drops every pending timer and frame and returns to Idle. Idempotent.
    void cancel();

    InteractionPhase               phase()         const { return current; }
    bool                           has_driver()    const { return driver.kind != DriverKind::None; }
    bool                           hold_armed()    const { return driver.kind == DriverKind::HoldArm; }
    const std::optional<Viewport>& last_viewport() const { return last_vp; }
    const SchedulerConfig&         config()        const { return cfg; }

    void set_stats_listener(StatsFn fn) { stats_listener = std::move(fn); }

private:
    enum class DriverKind { None, SettleTimer, HoldArm, AnimationFrame, HoldFrame };

    struct Driver {
        DriverKind          kind   = DriverKind::None;
        FrameClock::Handle  handle = 0;
    };

    struct Animation {
        Viewport       start;
        Viewport       target;
        double         aspect   = 1.0;
        double         start_ms = 0.0;
        RenderSettings settings;
        CompletionFn   on_complete;
    };

    struct Hold {
        Viewport                start;
        PlanePoint              target;
        double                  aspect   = 1.0;
        double                  start_ms = 0.0;
        RenderSettings          settings;
        std::optional<Viewport> last;     // most recent frame's viewport
    };

    void drop_driver();
    void enter(InteractionPhase next);
    void reset_to_idle();

    void arm_settle_timer();
    void arm_frame(DriverKind kind);

    void on_settle_timer(std::uint64_t gen);
    void on_hold_arm(std::uint64_t gen);
    void on_animation_frame(std::uint64_t gen, double now_ms);
    void on_hold_frame(std::uint64_t gen, double now_ms);

    void issue(const RenderRequest& req);
    void remember(const Viewport& vp, const RenderSettings& settings);

    template<typename Fn>
    void guarded(Fn&& fn);

    RenderSurface&  surface;
    FrameClock&     clock;
    SchedulerConfig cfg;

    InteractionPhase current    = InteractionPhase::Idle;
    Driver           driver;
    std::uint64_t    generation = 0;   // bumped whenever the driver is replaced

    std::optional<Viewport>       last_vp;
    std::optional<RenderSettings> last_settings;

    std::optional<std::string> applied_ramp;
    double                     applied_gamma = 1.0;

    Animation anim;
    Hold      hold;
    StatsFn   stats_listener;
};
