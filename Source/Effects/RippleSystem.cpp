#include "RippleSystem.h"
#include <algorithm>
#include <cmath>

namespace hexglow {

RippleSystem::RippleSystem(uint32_t seed)
    : rng_(seed)
{
}

double RippleSystem::uniform(double lo, double hi)
{
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}

// ============================================================
// Lifecycle
// ============================================================

void RippleSystem::seed(double surfaceWidth, double surfaceHeight)
{
    ripples_.clear();
    if (surfaceWidth <= 0.0 || surfaceHeight <= 0.0)
        return;

    for (int i = 0; i < params_.initialRipples; ++i) {
        Ripple r;
        r.cx        = uniform(0.0, surfaceWidth);
        r.cy        = uniform(0.0, surfaceHeight);
        r.radius    = uniform(0.0, 100.0);
        r.maxRadius = uniform(150.0, 250.0);
        r.strength  = uniform(0.3, 0.7);
        r.speed     = uniform(0.5, 1.5);
        ripples_.push_back(r);
    }
}

void RippleSystem::advance(int64_t frameIndex, double surfaceWidth, double surfaceHeight)
{
    for (auto& r : ripples_)
        r.radius += r.speed;

    ripples_.erase(
        std::remove_if(ripples_.begin(), ripples_.end(),
                       [](const Ripple& r) { return r.radius >= r.maxRadius; }),
        ripples_.end());

    if (params_.spawnInterval > 0
        && frameIndex % params_.spawnInterval == 0
        && (int)ripples_.size() < params_.cap)
        spawn(surfaceWidth, surfaceHeight);
}

void RippleSystem::spawn(double surfaceWidth, double surfaceHeight)
{
    if (surfaceWidth <= 0.0 || surfaceHeight <= 0.0)
        return;

    int lo = std::max(0, params_.spawnMin);
    int hi = std::max(lo, params_.spawnMax);
    std::uniform_int_distribution<int> countDist(lo, hi);
    int count = countDist(rng_);

    for (int i = 0; i < count; ++i) {
        Ripple r;
        r.cx        = uniform(0.0, surfaceWidth);
        r.cy        = uniform(0.0, surfaceHeight);
        r.radius    = 0.0;
        r.maxRadius = uniform(100.0, 250.0);
        r.strength  = uniform(0.3, 0.8);
        r.speed     = uniform(0.8, 2.0);
        ripples_.push_back(r);
    }
}

bool RippleSystem::addRipple(const Ripple& r)
{
    if (!(r.radius >= 0.0 && r.radius < r.maxRadius))
        return false;
    if (!(r.speed > 0.0) || !(r.strength > 0.0 && r.strength <= 1.0))
        return false;
    ripples_.push_back(r);
    return true;
}

// ============================================================
// Influence query
// ============================================================

double RippleSystem::influenceAt(double x, double y) const
{
    if (params_.ringWidth <= 0.0)
        return 0.0;

    double best = 0.0;
    for (auto& r : ripples_) {
        double dx = x - r.cx, dy = y - r.cy;
        double band = std::abs(std::sqrt(dx * dx + dy * dy) - r.radius);
        if (band >= params_.ringWidth)
            continue;

        double ring = 1.0 - band / params_.ringWidth;
        double fade = 1.0 - r.radius / r.maxRadius;
        best = std::max(best, ring * r.strength * fade);
    }
    return std::clamp(best, 0.0, 1.0);
}

} // namespace hexglow
