#include "render_scheduler.hpp"
#include "zoom_planner.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

// Surface double: records every draw and ramp change.
class RecordingSurface : public RenderSurface {
public:
    struct Draw {
        Viewport viewport;
        int      iterations;
    };

    RenderStats draw(const Viewport& vp, const RenderSettings& s) override
    {
        if (fail) throw std::runtime_error("surface lost");
        draws.push_back({vp, s.max_iterations});
        RenderStats st;
        st.iteration_count = s.max_iterations;
        st.render_ms       = 1.5;
        return st;
    }

    void set_color_ramp(const std::string& name, double gamma) override
    {
        ramps.emplace_back(name, gamma);
    }

    std::vector<Draw>                          draws;
    std::vector<std::pair<std::string, double>> ramps;
    bool                                       fail = false;
};

constexpr double ASPECT = 800.0 / 450.0;

class RenderSchedulerTest : public ::testing::Test {
protected:
    RecordingSurface surface;
    LoopClock        clock;
    RenderScheduler  scheduler{surface, clock};
    RenderSettings   settings;
    const Viewport   home = reset_viewport(ASPECT);

    const RecordingSurface::Draw& last_draw() const { return surface.draws.back(); }
};

} // namespace

// ----------------------------------------------------------------------------
// Requests
// ----------------------------------------------------------------------------

TEST(RenderRequestTest, InteractiveUsesReducedBudget)
{
    RenderSettings s;
    s.quality = QualityPreset::Ultra;

    const RenderRequest full = make_render_request(Viewport{}, s, false);
    EXPECT_FALSE(full.iterations_override.has_value());

    const RenderRequest fast = make_render_request(Viewport{}, s, true);
    ASSERT_TRUE(fast.iterations_override.has_value());
    EXPECT_EQ(*fast.iterations_override, 128);

    // The drag preference does not apply to frame-driven motion.
    s.reduce_quality_while_dragging = false;
    ASSERT_TRUE(make_render_request(Viewport{}, s, true).iterations_override.has_value());
    EXPECT_EQ(*make_render_request(Viewport{}, s, true).iterations_override, 128);
}

TEST_F(RenderSchedulerTest, IdleRequestDrawsAtFullQuality)
{
    scheduler.request_render(home, settings);

    ASSERT_EQ(surface.draws.size(), 1u);
    EXPECT_EQ(last_draw().iterations, 256);
    EXPECT_EQ(last_draw().viewport, home);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_FALSE(scheduler.has_driver());
    ASSERT_TRUE(scheduler.last_viewport().has_value());
    EXPECT_EQ(*scheduler.last_viewport(), home);
}

TEST_F(RenderSchedulerTest, RampIsSentOnlyWhenPaletteOrGammaChange)
{
    scheduler.request_render(home, settings);
    scheduler.request_render(home, settings);
    ASSERT_EQ(surface.ramps.size(), 1u);
    EXPECT_EQ(surface.ramps[0].first, "classic");

    settings.palette = "inferno";
    scheduler.request_render(home, settings);
    ASSERT_EQ(surface.ramps.size(), 2u);
    EXPECT_EQ(surface.ramps[1].first, "inferno");

    settings.gamma = 2.2;
    scheduler.request_render(home, settings);
    ASSERT_EQ(surface.ramps.size(), 3u);
    EXPECT_DOUBLE_EQ(surface.ramps[2].second, 2.2);
}

TEST_F(RenderSchedulerTest, StatsListenerSeesEveryDraw)
{
    std::vector<RenderStats> seen;
    scheduler.set_stats_listener([&](const RenderStats& s) { seen.push_back(s); });

    scheduler.begin_interaction();
    scheduler.request_render(home, settings);
    scheduler.end_interaction();
    clock.advance(200.0);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].iteration_count, 64);
    EXPECT_EQ(seen[1].iteration_count, 256);
    EXPECT_DOUBLE_EQ(seen[1].render_ms, 1.5);
}

// ----------------------------------------------------------------------------
// Drag and settle
// ----------------------------------------------------------------------------

TEST_F(RenderSchedulerTest, DraggingDrawsReducedQuality)
{
    scheduler.begin_interaction();
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Dragging);

    scheduler.request_render(home, settings);
    ASSERT_EQ(surface.draws.size(), 1u);
    EXPECT_EQ(last_draw().iterations, 64);

    settings.reduce_quality_while_dragging = false;
    scheduler.request_render(home, settings);
    EXPECT_EQ(last_draw().iterations, 256);
}

TEST_F(RenderSchedulerTest, SettleTimerRefinesAfterQuietPeriod)
{
    scheduler.begin_interaction();
    scheduler.request_render(home, settings);
    scheduler.end_interaction();

    EXPECT_EQ(scheduler.phase(), InteractionPhase::Settling);
    EXPECT_TRUE(scheduler.has_driver());

    clock.advance(199.0);
    EXPECT_EQ(surface.draws.size(), 1u);

    clock.advance(200.0);
    ASSERT_EQ(surface.draws.size(), 2u);
    EXPECT_EQ(last_draw().iterations, 256);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_FALSE(scheduler.has_driver());
    EXPECT_EQ(clock.pending(), 0u);
}

TEST_F(RenderSchedulerTest, RequestWhileSettlingRestartsTimer)
{
    scheduler.begin_interaction();
    scheduler.request_render(home, settings);
    scheduler.end_interaction();

    clock.advance(150.0);
    const Viewport moved = pan_by_pixels(home, 10.0, 0.0, CanvasSize{800.0, 450.0});
    scheduler.request_render(moved, settings);
    EXPECT_EQ(surface.draws.size(), 1u);

    clock.advance(300.0);
    EXPECT_EQ(surface.draws.size(), 1u);

    clock.advance(350.0);
    ASSERT_EQ(surface.draws.size(), 2u);
    EXPECT_EQ(last_draw().viewport, moved);
    EXPECT_EQ(clock.pending(), 0u);
}

TEST_F(RenderSchedulerTest, NewDragDuringSettleCancelsRefinement)
{
    scheduler.begin_interaction();
    scheduler.request_render(home, settings);
    scheduler.end_interaction();
    clock.advance(100.0);

    scheduler.begin_interaction();
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Dragging);
    EXPECT_EQ(clock.pending(), 0u);

    clock.advance(1000.0);
    EXPECT_EQ(surface.draws.size(), 1u);
}

TEST_F(RenderSchedulerTest, EndWithoutProgressiveRefinementDrawsAtOnce)
{
    settings.progressive_refinement = false;
    scheduler.begin_interaction();
    scheduler.request_render(home, settings);
    scheduler.end_interaction();

    ASSERT_EQ(surface.draws.size(), 2u);
    EXPECT_EQ(last_draw().iterations, 256);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_EQ(clock.pending(), 0u);
}

TEST_F(RenderSchedulerTest, EndWithNothingRequestedGoesIdle)
{
    scheduler.begin_interaction();
    scheduler.end_interaction();

    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_TRUE(surface.draws.empty());
    EXPECT_EQ(clock.pending(), 0u);
}

TEST_F(RenderSchedulerTest, EndOutsideDraggingIsIgnored)
{
    scheduler.end_interaction();
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);

    scheduler.animate_zoom(home, settings, PlanePoint{-0.75, 0.1}, ASPECT);
    scheduler.end_interaction();
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Animating);
}

TEST_F(RenderSchedulerTest, DebouncedRequestWaitsForSettleDelay)
{
    scheduler.request_render(home, settings, true);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Settling);
    EXPECT_TRUE(surface.draws.empty());

    clock.advance(200.0);
    ASSERT_EQ(surface.draws.size(), 1u);
    EXPECT_EQ(last_draw().iterations, 256);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
}

// ----------------------------------------------------------------------------
// Click zoom animation
// ----------------------------------------------------------------------------

TEST_F(RenderSchedulerTest, AnimationEasesToTargetAndCompletesOnce)
{
    const PlanePoint target{-0.75, 0.1};
    std::vector<Viewport> completed;
    scheduler.animate_zoom(home, settings, target, ASPECT,
                           [&](const Viewport& vp) { completed.push_back(vp); });
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Animating);
    EXPECT_TRUE(surface.draws.empty());

    clock.advance(16.0);
    ASSERT_EQ(surface.draws.size(), 1u);
    EXPECT_EQ(last_draw().iterations, 64);

    clock.advance(225.0);
    ASSERT_EQ(surface.draws.size(), 2u);
    EXPECT_NEAR(last_draw().viewport.center_re, (home.center_re + target.re) / 2.0, 1e-12);
    EXPECT_NEAR(last_draw().viewport.width, (home.width + home.width / 2.0) / 2.0, 1e-12);
    EXPECT_TRUE(completed.empty());

    clock.advance(450.0);
    ASSERT_EQ(surface.draws.size(), 3u);
    EXPECT_EQ(last_draw().iterations, 256);
    EXPECT_DOUBLE_EQ(last_draw().viewport.center_re, target.re);
    EXPECT_DOUBLE_EQ(last_draw().viewport.center_im, target.im);
    EXPECT_DOUBLE_EQ(last_draw().viewport.width, home.width / 2.0);

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0], last_draw().viewport);
    EXPECT_EQ(*scheduler.last_viewport(), completed[0]);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_EQ(clock.pending(), 0u);

    clock.advance(1000.0);
    EXPECT_EQ(surface.draws.size(), 3u);
    EXPECT_EQ(completed.size(), 1u);
}

TEST_F(RenderSchedulerTest, MotionFramesStayReducedWithoutDragReduction)
{
    settings.reduce_quality_while_dragging = false;

    scheduler.animate_zoom(home, settings, PlanePoint{-0.75, 0.1}, ASPECT);
    for (double t = 16.0; t < 450.0; t += 16.0)
        clock.advance(t);
    ASSERT_FALSE(surface.draws.empty());
    for (const RecordingSurface::Draw& d : surface.draws)
        EXPECT_EQ(d.iterations, 64);

    clock.advance(450.0);
    EXPECT_EQ(last_draw().iterations, 256);

    scheduler.start_hold_zoom(home, settings, PlanePoint{0.0, 0.0}, ASPECT);
    clock.advance(466.0);
    EXPECT_EQ(last_draw().iterations, 64);

    scheduler.stop_hold_zoom(settings);
    EXPECT_EQ(last_draw().iterations, 256);
}

TEST_F(RenderSchedulerTest, RequestDuringAnimationWins)
{
    bool completed = false;
    scheduler.animate_zoom(home, settings, PlanePoint{-0.75, 0.1}, ASPECT,
                           [&](const Viewport&) { completed = true; });
    clock.advance(16.0);

    const Viewport other = create_viewport(0.25, 0.0, 0.5, 0.5 / ASPECT);
    scheduler.request_render(other, settings);

    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_EQ(last_draw().viewport, other);
    EXPECT_EQ(last_draw().iterations, 256);

    const size_t count = surface.draws.size();
    clock.advance(1000.0);
    EXPECT_EQ(surface.draws.size(), count);
    EXPECT_FALSE(completed);
}

TEST_F(RenderSchedulerTest, NewAnimationReplacesRunningOne)
{
    int first = 0, second = 0;
    scheduler.animate_zoom(home, settings, PlanePoint{-0.75, 0.1}, ASPECT,
                           [&](const Viewport&) { ++first; });
    clock.advance(100.0);
    scheduler.animate_zoom(home, settings, PlanePoint{0.3, 0.0}, ASPECT,
                           [&](const Viewport&) { ++second; });

    for (double t = 116.0; t <= 700.0; t += 16.0)
        clock.advance(t);

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
    EXPECT_DOUBLE_EQ(scheduler.last_viewport()->center_re, 0.3);
}

// ----------------------------------------------------------------------------
// Cancel
// ----------------------------------------------------------------------------

TEST_F(RenderSchedulerTest, CancelOnIdleHasNoEffect)
{
    scheduler.request_render(home, settings);
    scheduler.cancel();
    scheduler.cancel();

    EXPECT_EQ(surface.draws.size(), 1u);
    EXPECT_EQ(surface.ramps.size(), 1u);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_EQ(*scheduler.last_viewport(), home);
}

TEST_F(RenderSchedulerTest, CancelDropsEverythingPending)
{
    bool completed = false;
    scheduler.animate_zoom(home, settings, PlanePoint{-0.75, 0.1}, ASPECT,
                           [&](const Viewport&) { completed = true; });
    clock.advance(16.0);
    scheduler.cancel();

    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_FALSE(scheduler.has_driver());
    EXPECT_EQ(clock.pending(), 0u);

    const size_t count = surface.draws.size();
    clock.advance(2000.0);
    EXPECT_EQ(surface.draws.size(), count);
    EXPECT_FALSE(completed);

    scheduler.cancel();
    EXPECT_EQ(surface.draws.size(), count);
}

TEST_F(RenderSchedulerTest, CancelStopsSettleTimer)
{
    scheduler.request_render(home, settings, true);
    scheduler.cancel();
    clock.advance(500.0);
    EXPECT_TRUE(surface.draws.empty());
}

TEST(RenderSchedulerLifetimeTest, DestructionCancelsPendingCallbacks)
{
    RecordingSurface surface;
    LoopClock        clock;
    {
        RenderScheduler scheduler(surface, clock);
        scheduler.animate_zoom(reset_viewport(1.0), RenderSettings{}, PlanePoint{0.0, 0.0}, 1.0);
        EXPECT_EQ(clock.pending(), 1u);
    }
    EXPECT_EQ(clock.pending(), 0u);
    clock.advance(100.0);
    EXPECT_TRUE(surface.draws.empty());
}

// ----------------------------------------------------------------------------
// Hold zoom
// ----------------------------------------------------------------------------

TEST_F(RenderSchedulerTest, HoldZoomStartsAfterArmDelay)
{
    const PlanePoint target{-0.74, 0.12};
    scheduler.arm_hold_zoom(home, settings, target, ASPECT);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Dragging);
    EXPECT_TRUE(scheduler.hold_armed());

    clock.advance(199.0);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Dragging);

    clock.advance(200.0);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::HoldZooming);
    EXPECT_FALSE(scheduler.hold_armed());
    EXPECT_TRUE(surface.draws.empty());

    clock.advance(216.0);
    ASSERT_EQ(surface.draws.size(), 1u);
    EXPECT_EQ(last_draw().iterations, 64);
    EXPECT_DOUBLE_EQ(last_draw().viewport.center_re, target.re);
    EXPECT_DOUBLE_EQ(last_draw().viewport.center_im, target.im);

    clock.advance(1200.0);
    ASSERT_EQ(surface.draws.size(), 2u);
    EXPECT_NEAR(last_draw().viewport.width, home.width * std::exp(-1.6), 1e-12);

    std::vector<Viewport> committed;
    EXPECT_TRUE(scheduler.stop_hold_zoom(settings,
                                         [&](const Viewport& vp) { committed.push_back(vp); }));
    ASSERT_EQ(surface.draws.size(), 3u);
    EXPECT_EQ(last_draw().iterations, 256);
    ASSERT_EQ(committed.size(), 1u);
    EXPECT_EQ(committed[0], last_draw().viewport);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_EQ(clock.pending(), 0u);
}

TEST_F(RenderSchedulerTest, HoldSpanShrinksMonotonically)
{
    scheduler.start_hold_zoom(home, settings, PlanePoint{0.0, 0.0}, ASPECT);
    for (double t = 16.0; t <= 800.0; t += 16.0)
        clock.advance(t);

    ASSERT_GT(surface.draws.size(), 10u);
    for (size_t i = 1; i < surface.draws.size(); ++i)
        EXPECT_LT(surface.draws[i].viewport.width, surface.draws[i - 1].viewport.width);
}

TEST_F(RenderSchedulerTest, CanceledArmNeverStartsHoldZoom)
{
    scheduler.arm_hold_zoom(home, settings, PlanePoint{0.0, 0.0}, ASPECT);
    EXPECT_TRUE(scheduler.cancel_hold_arm());
    EXPECT_FALSE(scheduler.cancel_hold_arm());

    clock.advance(1000.0);
    EXPECT_TRUE(surface.draws.empty());
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Dragging);
}

TEST_F(RenderSchedulerTest, BeginInteractionDisarmsHold)
{
    scheduler.arm_hold_zoom(home, settings, PlanePoint{0.0, 0.0}, ASPECT);
    scheduler.begin_interaction();
    EXPECT_FALSE(scheduler.hold_armed());

    clock.advance(1000.0);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Dragging);
}

TEST_F(RenderSchedulerTest, StopWithoutHoldReturnsFalse)
{
    bool called = false;
    EXPECT_FALSE(scheduler.stop_hold_zoom(settings, [&](const Viewport&) { called = true; }));
    EXPECT_FALSE(called);
    EXPECT_TRUE(surface.draws.empty());
}

TEST_F(RenderSchedulerTest, StopBeforeFirstHoldFrameDrawsNothing)
{
    bool called = false;
    scheduler.start_hold_zoom(home, settings, PlanePoint{0.0, 0.0}, ASPECT);
    EXPECT_TRUE(scheduler.stop_hold_zoom(settings, [&](const Viewport&) { called = true; }));

    EXPECT_FALSE(called);
    EXPECT_TRUE(surface.draws.empty());
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_EQ(clock.pending(), 0u);
}

TEST_F(RenderSchedulerTest, AnimationDuringHoldCancelsHold)
{
    int hold_commits = 0;
    scheduler.start_hold_zoom(home, settings, PlanePoint{0.0, 0.0}, ASPECT);
    clock.advance(16.0);
    ASSERT_EQ(surface.draws.size(), 1u);

    bool animated = false;
    scheduler.animate_zoom(home, settings, PlanePoint{-0.75, 0.1}, ASPECT,
                           [&](const Viewport&) { animated = true; });
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Animating);

    EXPECT_FALSE(scheduler.stop_hold_zoom(settings, [&](const Viewport&) { ++hold_commits; }));

    for (double t = 32.0; t <= 600.0; t += 16.0)
        clock.advance(t);

    EXPECT_TRUE(animated);
    EXPECT_EQ(hold_commits, 0);
    EXPECT_DOUBLE_EQ(scheduler.last_viewport()->center_re, -0.75);
}

// ----------------------------------------------------------------------------
// Surface failures
// ----------------------------------------------------------------------------

TEST_F(RenderSchedulerTest, FailedDrawPropagatesAndResets)
{
    surface.fail = true;
    scheduler.begin_interaction();
    EXPECT_THROW(scheduler.request_render(home, settings), std::runtime_error);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_FALSE(scheduler.has_driver());
}

TEST_F(RenderSchedulerTest, FailedFrameDrawLeavesNothingArmed)
{
    scheduler.animate_zoom(home, settings, PlanePoint{-0.75, 0.1}, ASPECT);
    surface.fail = true;

    EXPECT_THROW(clock.advance(16.0), std::runtime_error);
    EXPECT_EQ(scheduler.phase(), InteractionPhase::Idle);
    EXPECT_EQ(clock.pending(), 0u);

    surface.fail = false;
    scheduler.request_render(home, settings);
    EXPECT_EQ(surface.draws.size(), 1u);
}
