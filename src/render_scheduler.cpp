#include "render_scheduler.hpp"
#include "zoom_planner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

const char* phase_name(InteractionPhase p)
{
    switch (p) {
        case InteractionPhase::Idle:        return "idle";
        case InteractionPhase::Dragging:    return "dragging";
        case InteractionPhase::Animating:   return "animating";
        case InteractionPhase::HoldZooming: return "hold-zooming";
        case InteractionPhase::Settling:    return "settling";
    }
    return "idle";
}

RenderRequest make_render_request(const Viewport& vp, const RenderSettings& s,
                                  bool interactive)
{
    RenderRequest req{vp, s, std::nullopt};
    if (interactive)
        req.iterations_override = progressive_iterations(s.quality, true);
    return req;
}

// ----------------------------------------------------------------------------
// Lifetime
// ----------------------------------------------------------------------------

RenderScheduler::RenderScheduler(RenderSurface& surface_, FrameClock& clock_,
                                 SchedulerConfig config)
    : surface(surface_), clock(clock_), cfg(config)
{
}

RenderScheduler::~RenderScheduler()
{
    drop_driver();
}

// Runs `fn`; if the surface throws, nothing is left armed and the error
// reaches whoever triggered the draw.
template<typename Fn>
void RenderScheduler::guarded(Fn&& fn)
{
    try {
        fn();
    } catch (const std::exception& e) {
        spdlog::error("render scheduler: draw failed in {} phase: {}", phase_name(current), e.what());
        reset_to_idle();
        throw;
    }
}

// ----------------------------------------------------------------------------
// Driver bookkeeping
// ----------------------------------------------------------------------------

void RenderScheduler::drop_driver()
{
    if (driver.kind != DriverKind::None)
        clock.cancel(driver.handle);
    driver = Driver{};
    ++generation;
}

void RenderScheduler::enter(InteractionPhase next)
{
    if (next != current)
        spdlog::debug("render scheduler: {} -> {}", phase_name(current), phase_name(next));
    current = next;
}

void RenderScheduler::reset_to_idle()
{
    drop_driver();
    anim = Animation{};
    hold = Hold{};
    enter(InteractionPhase::Idle);
}

void RenderScheduler::arm_settle_timer()
{
    drop_driver();
    const std::uint64_t gen = generation;
    driver.kind   = DriverKind::SettleTimer;
    driver.handle = clock.arm_timer(cfg.settle_delay_ms, [this, gen] { on_settle_timer(gen); });
}

void RenderScheduler::arm_frame(DriverKind kind)
{
    drop_driver();
    const std::uint64_t gen = generation;
    driver.kind = kind;
    if (kind == DriverKind::AnimationFrame)
        driver.handle = clock.request_frame([this, gen](double now) { on_animation_frame(gen, now); });
    else
        driver.handle = clock.request_frame([this, gen](double now) { on_hold_frame(gen, now); });
}

// ----------------------------------------------------------------------------
// Drawing
// ----------------------------------------------------------------------------

void RenderScheduler::issue(const RenderRequest& req)
{
    const RenderSettings& s = req.settings;
    if (!applied_ramp || *applied_ramp != s.palette || applied_gamma != s.gamma) {
        surface.set_color_ramp(s.palette, s.gamma);
        applied_ramp  = s.palette;
        applied_gamma = s.gamma;
    }

    const RenderStats stats = req.iterations_override
        ? surface.draw(req.viewport, with_iterations(s, *req.iterations_override))
        : surface.draw(req.viewport, s);

    if (stats_listener)
        stats_listener(stats);
}

void RenderScheduler::remember(const Viewport& vp, const RenderSettings& settings)
{
    last_vp       = vp;
    last_settings = settings;
}

// ----------------------------------------------------------------------------
// Drag / settle
// ----------------------------------------------------------------------------

void RenderScheduler::begin_interaction()
{
    drop_driver();
    anim = Animation{};
    hold = Hold{};
    enter(InteractionPhase::Dragging);
}

void RenderScheduler::end_interaction()
{
    if (current != InteractionPhase::Dragging)
        return;

    drop_driver();
    if (!last_vp || !last_settings) {
        enter(InteractionPhase::Idle);
        return;
    }

    if (!last_settings->progressive_refinement) {
        enter(InteractionPhase::Idle);
        guarded([&] { issue(make_render_request(*last_vp, *last_settings, false)); });
        return;
    }

    enter(InteractionPhase::Settling);
    arm_settle_timer();
}

void RenderScheduler::request_render(const Viewport& vp, const RenderSettings& settings,
                                     bool debounce)
{
    remember(vp, settings);

    switch (current) {
        case InteractionPhase::Dragging:
            guarded([&] {
                issue(make_render_request(vp, settings, settings.reduce_quality_while_dragging));
            });
            return;

        case InteractionPhase::Settling:
            arm_settle_timer();
            return;

        case InteractionPhase::Animating:
        case InteractionPhase::HoldZooming:
            spdlog::debug("render scheduler: request supersedes {}", phase_name(current));
            reset_to_idle();
            break;

        case InteractionPhase::Idle:
            break;
    }

    if (debounce) {
        enter(InteractionPhase::Settling);
        arm_settle_timer();
        return;
    }
    guarded([&] { issue(make_render_request(vp, settings, false)); });
}

void RenderScheduler::on_settle_timer(std::uint64_t gen)
{
    if (gen != generation || driver.kind != DriverKind::SettleTimer)
        return;

    driver = Driver{};
    ++generation;
    enter(InteractionPhase::Idle);
    if (last_vp && last_settings)
        guarded([&] { issue(make_render_request(*last_vp, *last_settings, false)); });
}

// ----------------------------------------------------------------------------
// Click zoom animation
// ----------------------------------------------------------------------------

void RenderScheduler::animate_zoom(const Viewport& start, const RenderSettings& settings,
                                   PlanePoint target, double aspect_ratio,
                                   CompletionFn on_complete)
{
    reset_to_idle();

    anim.start       = start;
    anim.target      = zoom_toward_point(start, target, settings.zoom_factor, aspect_ratio);
    anim.aspect      = aspect_ratio;
    anim.start_ms    = clock.now_ms();
    anim.settings    = settings;
    anim.on_complete = std::move(on_complete);

    enter(InteractionPhase::Animating);
    arm_frame(DriverKind::AnimationFrame);
}

void RenderScheduler::on_animation_frame(std::uint64_t gen, double now_ms)
{
    if (gen != generation || driver.kind != DriverKind::AnimationFrame)
        return;
    driver = Driver{};

    const double duration = cfg.animation_ms > 0.0 ? cfg.animation_ms : 1.0;
    const double t        = std::min(1.0, std::max(0.0, (now_ms - anim.start_ms) / duration));

    if (t < 1.0) {
        const Viewport vp = interpolate_viewport(anim.start, anim.target, anim.aspect,
                                                 ease_in_out_quad(t));
        guarded([&] { issue(make_render_request(vp, anim.settings, true)); });
        arm_frame(DriverKind::AnimationFrame);
        return;
    }

    // Finished. The callback may start another interaction, so it runs last
    // on copies.
    const Viewport       final_vp = anim.target;
    const RenderSettings settings = anim.settings;
    const CompletionFn   done     = std::move(anim.on_complete);

    ++generation;
    anim = Animation{};
    enter(InteractionPhase::Idle);
    guarded([&] { issue(make_render_request(final_vp, settings, false)); });
    remember(final_vp, settings);

    if (done)
        done(final_vp);
}

// ----------------------------------------------------------------------------
// Hold zoom
// ----------------------------------------------------------------------------

void RenderScheduler::arm_hold_zoom(const Viewport& vp, const RenderSettings& settings,
                                    PlanePoint target, double aspect_ratio)
{
    drop_driver();
    anim = Animation{};

    hold          = Hold{};
    hold.start    = vp;
    hold.target   = target;
    hold.aspect   = aspect_ratio;
    hold.settings = settings;

    enter(InteractionPhase::Dragging);
    const std::uint64_t gen = generation;
    driver.kind   = DriverKind::HoldArm;
    driver.handle = clock.arm_timer(cfg.hold_delay_ms, [this, gen] { on_hold_arm(gen); });
}

bool RenderScheduler::cancel_hold_arm()
{
    if (driver.kind != DriverKind::HoldArm)
        return false;
    drop_driver();
    hold = Hold{};
    spdlog::debug("render scheduler: hold-zoom arm canceled");
    return true;
}

void RenderScheduler::on_hold_arm(std::uint64_t gen)
{
    if (gen != generation || driver.kind != DriverKind::HoldArm)
        return;
    driver = Driver{};

    const Hold pending = hold;
    start_hold_zoom(pending.start, pending.settings, pending.target, pending.aspect);
}

void RenderScheduler::start_hold_zoom(const Viewport& vp, const RenderSettings& settings,
                                      PlanePoint target, double aspect_ratio)
{
    reset_to_idle();

    hold.start    = vp;
    hold.target   = target;
    hold.aspect   = aspect_ratio;
    hold.start_ms = clock.now_ms();
    hold.settings = settings;

    enter(InteractionPhase::HoldZooming);
    arm_frame(DriverKind::HoldFrame);
}

void RenderScheduler::on_hold_frame(std::uint64_t gen, double now_ms)
{
    if (gen != generation || driver.kind != DriverKind::HoldFrame)
        return;
    driver = Driver{};

    const double elapsed_s = (now_ms - hold.start_ms) / 1000.0;
    const Viewport vp = hold_zoom_trajectory(hold.start, hold.target, hold.aspect,
                                             elapsed_s, cfg.hold_rate_per_s);
    hold.last = vp;
    guarded([&] { issue(make_render_request(vp, hold.settings, true)); });
    arm_frame(DriverKind::HoldFrame);
}

bool RenderScheduler::stop_hold_zoom(const RenderSettings& settings, CompletionFn on_complete)
{
    if (current != InteractionPhase::HoldZooming)
        return false;

    const std::optional<Viewport> final_vp = hold.last;
    reset_to_idle();

    if (!final_vp)
        return true;

    guarded([&] { issue(make_render_request(*final_vp, settings, false)); });
    remember(*final_vp, settings);
    if (on_complete)
        on_complete(*final_vp);
    return true;
}

// ----------------------------------------------------------------------------

void RenderScheduler::cancel()
{
    if (current == InteractionPhase::Idle && driver.kind == DriverKind::None)
        return;
    reset_to_idle();
}
