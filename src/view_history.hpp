#pragma once

#include "viewport.hpp"

#include <cstddef>
#include <vector>

// Current view plus undo/redo stacks. Every navigation that should be
// undoable goes through push(); set() replaces the view without recording it.
class ViewHistory {
public:
    explicit ViewHistory(const Viewport& initial = Viewport{}) : cur(initial) {}

    // Records the current view and clears redo. A view equal to the current
    // one is ignored.
    void push(const Viewport& vp);
    void set(const Viewport& vp);
    bool undo();
    bool redo();
    // Records the current view and moves home. Unlike push(), this records
    // even when the current view is already the home view.
    void reset(double aspect_ratio);

    bool            can_undo()   const { return !past.empty(); }
    bool            can_redo()   const { return !future.empty(); }
    const Viewport& current()    const { return cur; }
    size_t          undo_depth() const { return past.size(); }

private:
    Viewport              cur;
    std::vector<Viewport> past;
    std::vector<Viewport> future;
};
