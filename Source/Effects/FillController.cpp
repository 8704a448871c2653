#include "FillController.h"
#include <algorithm>
#include <cmath>

namespace hexglow {

// ============================================================
// Ambient (noise-driven) target
// ============================================================

AmbientNoiseFill::AmbientNoiseFill(const NoiseField& noise, const AmbientParams& params)
    : noise_(noise), params_(params)
{
}

void AmbientNoiseFill::beginFrame(double timeSeconds, juce::Point<double> /*pointer*/)
{
    time_ = timeSeconds;
}

double AmbientNoiseFill::mapNoise(double n, const AmbientParams& params)
{
    double v = n * 0.5 + 0.5;
    double span = 1.0 - 2.0 * params.padding;
    if (span > 0.0)
        v = (v - params.padding) / span;
    v = std::clamp(v, 0.0, 1.0);
    v = std::pow(v, params.gamma);
    return std::isfinite(v) ? std::clamp(v, 0.0, 1.0) : 0.0;
}

double AmbientNoiseFill::targetFor(const Cell& cell) const
{
    double n = noise_.fbm(cell.x * params_.baseScale, cell.y * params_.baseScale,
                          time_, params_.fbm);
    return mapNoise(n, params_);
}

// ============================================================
// Pointer + ripple target
// ============================================================

PointerRippleFill::PointerRippleFill(const RippleSystem& ripples, double influenceRadius)
    : ripples_(ripples), influenceRadius_(influenceRadius)
{
}

void PointerRippleFill::beginFrame(double /*timeSeconds*/, juce::Point<double> pointer)
{
    pointer_ = pointer;
}

double PointerRippleFill::pointerInfluence(double distance, double influenceRadius)
{
    if (influenceRadius <= 0.0 || distance >= influenceRadius)
        return 0.0;
    return std::max(0.0, 1.0 - distance / influenceRadius);
}

double PointerRippleFill::targetFor(const Cell& cell) const
{
    double dx = cell.x - pointer_.x, dy = cell.y - pointer_.y;
    double fromPointer = pointerInfluence(std::sqrt(dx * dx + dy * dy), influenceRadius_);
    double fromRipples = ripples_.influenceAt(cell.x, cell.y);
    return std::clamp(std::max(fromPointer, fromRipples), 0.0, 1.0);
}

// ============================================================
// Smoothing
// ============================================================

namespace FillController {

double step(double current, double target, const SmoothingParams& params)
{
    double rate = target > current ? params.attackRate : params.releaseRate;
    double next = current + (target - current) * rate;
    return std::clamp(next, 0.0, 1.0);
}

void update(std::vector<Cell>& cells, const TargetFillStrategy& strategy,
            const SmoothingParams& params)
{
    for (auto& c : cells) {
        c.targetFillLevel = std::clamp(strategy.targetFor(c), 0.0, 1.0);
        c.fillLevel = step(c.fillLevel, c.targetFillLevel, params);
    }
}

} // namespace FillController
} // namespace hexglow
