#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

// The two suspension points the scheduler relies on: "call me on the next
// display frame" and "call me once after a delay". Either may be canceled
// before it fires; a canceled callback never runs.
class FrameClock {
public:
    using Handle        = std::uint64_t;   // 0 never names a pending callback
    using FrameCallback = std::function<void(double now_ms)>;
    using TimerCallback = std::function<void()>;

    virtual ~FrameClock() = default;

    virtual double now_ms() const = 0;
    virtual Handle request_frame(FrameCallback cb) = 0;
    virtual Handle arm_timer(double delay_ms, TimerCallback cb) = 0;
    // Unknown or already-fired handles are ignored.
    virtual void   cancel(Handle h) = 0;
};

// Clock driven by a host loop: call advance() once per displayed frame with
// the current time. Due timers fire first, in deadline order, then every
// frame callback that was pending when the tick began. Anything registered
// from inside a callback waits for a later tick.
class LoopClock : public FrameClock {
public:
    explicit LoopClock(double start_ms = 0.0) : current_ms(start_ms) {}

    double now_ms() const override { return current_ms; }
    Handle request_frame(FrameCallback cb) override;
    Handle arm_timer(double delay_ms, TimerCallback cb) override;
    void   cancel(Handle h) override;

    // Time never moves backwards; an earlier `now_ms` is treated as "now".
    void advance(double now_ms);

    size_t pending() const { return timers.size() + frames.size(); }
    bool   is_pending(Handle h) const;

private:
    struct Timer {
        Handle        id;
        double        deadline_ms;
        TimerCallback cb;
    };
    struct Frame {
        Handle        id;
        FrameCallback cb;
    };

    std::vector<Timer> timers;
    std::vector<Frame> frames;
    Handle             next_id    = 1;
    double             current_ms = 0.0;
};
