#include "frame_clock.hpp"

#include <algorithm>
#include <utility>

FrameClock::Handle LoopClock::request_frame(FrameCallback cb)
{
    const Handle id = next_id++;
    frames.push_back({id, std::move(cb)});
    return id;
}

FrameClock::Handle LoopClock::arm_timer(double delay_ms, TimerCallback cb)
{
    const Handle id = next_id++;
    timers.push_back({id, current_ms + std::max(0.0, delay_ms), std::move(cb)});
    return id;
}

void LoopClock::cancel(Handle h)
{
    if (h == 0) return;
    timers.erase(std::remove_if(timers.begin(), timers.end(),
                                [h](const Timer& t) { return t.id == h; }),
                 timers.end());
    frames.erase(std::remove_if(frames.begin(), frames.end(),
                                [h](const Frame& f) { return f.id == h; }),
                 frames.end());
}

bool LoopClock::is_pending(Handle h) const
{
    return std::any_of(timers.begin(), timers.end(), [h](const Timer& t) { return t.id == h; })
        || std::any_of(frames.begin(), frames.end(), [h](const Frame& f) { return f.id == h; });
}

void LoopClock::advance(double now_ms)
{
    current_ms = std::max(current_ms, now_ms);

    // Snapshot what is due now; callbacks may cancel or add entries.
    std::vector<std::pair<double, Handle>> due;
    for (const Timer& t : timers)
        if (t.deadline_ms <= current_ms) due.emplace_back(t.deadline_ms, t.id);
    std::sort(due.begin(), due.end());

    std::vector<Handle> frame_ids;
    frame_ids.reserve(frames.size());
    for (const Frame& f : frames) frame_ids.push_back(f.id);

    for (const auto& d : due) {
        auto it = std::find_if(timers.begin(), timers.end(),
                               [&d](const Timer& t) { return t.id == d.second; });
        if (it == timers.end()) continue;   // canceled by an earlier callback
        TimerCallback cb = std::move(it->cb);
        timers.erase(it);
        cb();
    }

    for (Handle id : frame_ids) {
        auto it = std::find_if(frames.begin(), frames.end(),
                               [id](const Frame& f) { return f.id == id; });
        if (it == frames.end()) continue;
        FrameCallback cb = std::move(it->cb);
        frames.erase(it);
        cb(current_ms);
    }
}
