#pragma once

#include <array>
#include <cstdint>

namespace hexglow {

// ============================================================
// Fractal composition settings (see NoiseField::fbm)
// ============================================================
struct FbmParams {
    int octaves       = 3;
    double lacunarity = 2.0;   // frequency multiplier per octave
    double gain       = 0.5;   // amplitude multiplier per octave
    double speed      = 0.35;  // amplitude oscillation rate (rad/s per octave index)
};

// ============================================================
// NoiseField: 2D gradient noise over a fixed permutation table
// ============================================================
class NoiseField {
public:
    static constexpr int MaxOctaves = 8;

    NoiseField();

    // Gradient noise in approximately [-1, 1]; pure function of (x, y)
    double noise2(double x, double y) const;

    // Multi-octave sum whose per-octave amplitude oscillates with t.
    // Coordinates are not translated by time, so the field pulses in place.
    // Normalised by the summed absolute weights; 0 when they sum to 0.
    double fbm(double x, double y, double t, const FbmParams& params) const;

    // Ken Perlin's reference permutation, doubled to 512 entries.
    // Built once, shared read-only by every NoiseField.
    static const std::array<uint8_t, 512>& permutation();

private:
    const std::array<uint8_t, 512>& perm_;
};

} // namespace hexglow
