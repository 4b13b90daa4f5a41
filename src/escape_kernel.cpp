#include "escape_kernel.hpp"
#include "thread_pool.hpp"

static double escape_value(const PlanePoint& p, int max_iter, bool smooth)
{
    return smooth ? smooth_escape(p.re, p.im, max_iter)
                  : static_cast<double>(escape_iterations(p.re, p.im, max_iter));
}

std::vector<double> batch_escape(const std::vector<PlanePoint>& points,
                                 int max_iter, bool smooth)
{
    std::vector<double> out;
    out.reserve(points.size());
    for (const PlanePoint& p : points)
        out.push_back(escape_value(p, max_iter, smooth));
    return out;
}

std::vector<double> batch_escape(const std::vector<PlanePoint>& points,
                                 int max_iter, bool smooth, ThreadPool& pool)
{
    constexpr size_t CHUNK = 4096;

    // Each slice writes a disjoint range, so no locking.
    std::vector<double> out(points.size(), 0.0);
    pool.parallel_for(points.size(), CHUNK,
        [&points, &out, max_iter, smooth](size_t begin, size_t end) {
            for (size_t i = begin; i < end; ++i)
                out[i] = escape_value(points[i], max_iter, smooth);
        });
    return out;
}
