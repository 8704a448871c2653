#pragma once

#include "../Grid/HexGrid.h"
#include "../Noise/NoiseField.h"
#include "RippleSystem.h"
#include <juce_graphics/juce_graphics.h>
#include <vector>

namespace hexglow {

// Pointer position used when the pointer is off the surface
inline constexpr double PointerOffscreen = -1000.0;

struct SmoothingParams {
    double attackRate  = 0.08;  // used while rising toward target
    double releaseRate = 0.03;  // used while falling
};

struct AmbientParams {
    FbmParams fbm;
    double baseScale = 0.01;  // surface pixels -> noise units
    double padding   = 0.05;  // trimmed from both ends before gamma
    double gamma     = 1.1;
};

// ============================================================
// TargetFillStrategy: where a cell's per-frame goal comes from
// ============================================================
class TargetFillStrategy {
public:
    virtual ~TargetFillStrategy() = default;

    // Called once per frame before any targetFor()
    virtual void beginFrame(double timeSeconds, juce::Point<double> pointer) = 0;

    // Goal fill for a cell this frame, 0 - 1
    virtual double targetFor(const Cell& cell) const = 0;
};

// fbm field mapped into [0,1] with padding and a mild gamma
class AmbientNoiseFill : public TargetFillStrategy {
public:
    AmbientNoiseFill(const NoiseField& noise, const AmbientParams& params);

    void beginFrame(double timeSeconds, juce::Point<double> pointer) override;
    double targetFor(const Cell& cell) const override;

    // Maps raw fbm output to a fill value
    static double mapNoise(double n, const AmbientParams& params);

private:
    const NoiseField& noise_;
    AmbientParams params_;
    double time_ = 0.0;
};

// max(pointer proximity, ripple ring)
class PointerRippleFill : public TargetFillStrategy {
public:
    PointerRippleFill(const RippleSystem& ripples, double influenceRadius);

    void beginFrame(double timeSeconds, juce::Point<double> pointer) override;
    double targetFor(const Cell& cell) const override;

    static double pointerInfluence(double distance, double influenceRadius);

private:
    const RippleSystem& ripples_;
    double influenceRadius_;
    juce::Point<double> pointer_ {PointerOffscreen, PointerOffscreen};
};

// ============================================================
// FillController: asymmetric exponential smoothing
// ============================================================
namespace FillController {

    // One smoothing step, result clamped to [0,1]
    double step(double current, double target, const SmoothingParams& params);

    // Refresh every cell's target from the strategy, then smooth
    void update(std::vector<Cell>& cells, const TargetFillStrategy& strategy,
                const SmoothingParams& params);

} // namespace FillController
} // namespace hexglow
