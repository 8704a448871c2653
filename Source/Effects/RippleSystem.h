#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace hexglow {

// ============================================================
// Ripple: expanding ring; retired once radius reaches maxRadius
// ============================================================
struct Ripple {
    double cx = 0.0, cy = 0.0;  // center, surface pixels
    double radius = 0.0;        // grows by speed each frame
    double maxRadius = 0.0;
    double strength = 0.0;      // (0, 1]
    double speed = 0.0;         // pixels per frame, > 0
};

struct RippleParams {
    int cap            = 8;     // no autonomous spawn at or above this count
    int spawnInterval  = 60;    // frames between spawn attempts, <= 0 disables
    int spawnMin       = 1;     // ripples per spawn attempt
    int spawnMax       = 2;
    int initialRipples = 3;     // placed by seed()
    double ringWidth   = 40.0;  // half-width of the bright band
};

class RippleSystem {
public:
    explicit RippleSystem(uint32_t seed = 0x5eedu);

    void setParams(const RippleParams& p) { params_ = p; }
    const RippleParams& getParams() const { return params_; }

    // Drop every ripple and place params.initialRipples partially grown ones
    void seed(double surfaceWidth, double surfaceHeight);

    // Grow, retire, then maybe spawn (frameIndex % spawnInterval == 0)
    void advance(int64_t frameIndex, double surfaceWidth, double surfaceHeight);

    // Strongest ring contribution at (x, y), 0 - 1
    double influenceAt(double x, double y) const;

    // Rejects ripples breaking 0 <= radius < maxRadius, speed > 0,
    // or strength in (0, 1]
    bool addRipple(const Ripple& r);

    void clear() { ripples_.clear(); }
    size_t size() const { return ripples_.size(); }
    bool empty() const { return ripples_.empty(); }
    const std::vector<Ripple>& getRipples() const { return ripples_; }

    void reseedRandom(uint32_t seed) { rng_.seed(seed); }

private:
    void spawn(double surfaceWidth, double surfaceHeight);
    double uniform(double lo, double hi);

    RippleParams params_;
    std::vector<Ripple> ripples_;
    std::mt19937 rng_;
};

} // namespace hexglow
