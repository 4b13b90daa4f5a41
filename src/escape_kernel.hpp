#pragma once

#include "viewport.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

class ThreadPool;

// Reference escape-time kernel for z <- z^2 + c, z0 = 0.
// A point has escaped once |z|^2 > BAILOUT_SQ.

constexpr double BAILOUT_SQ        = 4.0;
constexpr double MAGNITUDE_EPSILON = 1e-7;

// Where the orbit stopped: `iterations == max_iter` means it never escaped.
struct OrbitExit {
    int    iterations;
    double magnitude_sq;   // |z|^2 at the bailout check that stopped the loop
};

inline OrbitExit iterate_orbit(double c_re, double c_im, int max_iter)
{
    double zr = 0.0, zi = 0.0;
    int i = 0;
    while (i < max_iter) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        const double mag2 = zr2 + zi2;
        if (mag2 > BAILOUT_SQ)
            return {i, mag2};
        const double new_zr = zr2 - zi2 + c_re;
        zi = 2.0*zr*zi + c_im;
        zr = new_zr;
        ++i;
    }
    return {max_iter, zr*zr + zi*zi};
}

// Any implementation that takes ln(|z|) of a magnitude it did not produce in
// this kernel's own loop must pass it through here first: ln(|z|) -> 0 as
// |z| -> 1 and the smoothing ratio diverges.
inline double clamp_log_magnitude(double magnitude)
{
    return std::max(magnitude, 1.0 + MAGNITUDE_EPSILON);
}

// Continuous iteration count for an orbit that escaped at index `i` with
// modulus `magnitude`: i + 1 - ln(BAILOUT_SQ) / ln|z|, capped at max_iter.
inline double smooth_from_magnitude(int i, double magnitude, int max_iter)
{
    static const double log_bailout = std::log(BAILOUT_SQ);
    const double log_mag = std::log(clamp_log_magnitude(magnitude));
    const double smooth  = static_cast<double>(i) + 1.0 - log_bailout / log_mag;
    return std::min(smooth, static_cast<double>(max_iter));
}

// Iteration index at which the point escaped, or max_iter for interior
// points. A non-positive budget reports the point as interior.
inline int escape_iterations(double re, double im, int max_iter)
{
    return iterate_orbit(re, im, max_iter).iterations;
}

inline double smooth_escape(double re, double im, int max_iter)
{
    const OrbitExit exit = iterate_orbit(re, im, max_iter);
    if (exit.iterations >= max_iter)
        return static_cast<double>(max_iter);
    return smooth_from_magnitude(exit.iterations, std::sqrt(exit.magnitude_sq), max_iter);
}

struct EscapeResult {
    bool   interior        = true;
    int    iteration_count = 0;
    double smooth_value    = 0.0;   // meaningful only when !interior
};

inline EscapeResult classify_escape(double re, double im, int max_iter)
{
    const OrbitExit exit = iterate_orbit(re, im, max_iter);
    EscapeResult r;
    if (exit.iterations >= max_iter) {
        r.interior        = true;
        r.iteration_count = max_iter;
        r.smooth_value    = static_cast<double>(max_iter);
        return r;
    }
    r.interior        = false;
    r.iteration_count = exit.iterations;
    r.smooth_value    = smooth_from_magnitude(exit.iterations,
                                              std::sqrt(exit.magnitude_sq), max_iter);
    return r;
}

// One value per point, same order. Integer counts are returned as doubles
// when `smooth` is false.
std::vector<double> batch_escape(const std::vector<PlanePoint>& points,
                                 int max_iter, bool smooth);

// Same contract, split into chunks across `pool`.
std::vector<double> batch_escape(const std::vector<PlanePoint>& points,
                                 int max_iter, bool smooth, ThreadPool& pool);
