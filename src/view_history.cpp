#include "view_history.hpp"

void ViewHistory::push(const Viewport& vp)
{
    if (vp == cur) return;
    past.push_back(cur);
    cur = vp;
    future.clear();
}

void ViewHistory::set(const Viewport& vp)
{
    cur = vp;
    future.clear();
}

bool ViewHistory::undo()
{
    if (past.empty()) return false;
    future.push_back(cur);
    cur = past.back();
    past.pop_back();
    return true;
}

bool ViewHistory::redo()
{
    if (future.empty()) return false;
    past.push_back(cur);
    cur = future.back();
    future.pop_back();
    return true;
}

// Always recorded, even when already home.
void ViewHistory::reset(double aspect_ratio)
{
    past.push_back(cur);
    cur = reset_viewport(aspect_ratio);
    future.clear();
}
