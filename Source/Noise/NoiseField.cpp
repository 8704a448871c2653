#include "NoiseField.h"
#include <algorithm>
#include <cmath>

namespace hexglow {

namespace {

constexpr uint8_t kReferencePerm[256] = {
    151,160,137, 91, 90, 15,131, 13,201, 95, 96, 53,194,233,  7,225,
    140, 36,103, 30, 69,142,  8, 99, 37,240, 21, 10, 23,190,  6,148,
    247,120,234, 75,  0, 26,197, 62, 94,252,219,203,117, 35, 11, 32,
     57,177, 33, 88,237,149, 56, 87,174, 20,125,136,171,168, 68,175,
     74,165, 71,134,139, 48, 27,166, 77,146,158,231, 83,111,229,122,
     60,211,133,230,220,105, 92, 41, 55, 46,245, 40,244,102,143, 54,
     65, 25, 63,161,  1,216, 80, 73,209, 76,132,187,208, 89, 18,169,
    200,196,135,130,116,188,159, 86,164,100,109,198,173,186,  3, 64,
     52,217,226,250,124,123,  5,202, 38,147,118,126,255, 82, 85,212,
    207,206, 59,227, 47, 16, 58, 17,182,189, 28, 42,223,183,170,213,
    119,248,152,  2, 44,154,163, 70,221,153,101,155,167, 43,172,  9,
    129, 22, 39,253, 19, 98,108,110, 79,113,224,232,178,185,112,104,
    218,246, 97,228,251, 34,242,193,238,210,144, 12,191,179,162,241,
     81, 51,145,235,249, 14,239,107, 49,192,214, 31,181,199,106,157,
    184, 84,204,176,115,121, 50, 45,127,  4,150,254,138,236,205, 93,
    222,114, 67, 29, 24, 72,243,141,128,195, 78, 66,215, 61,156,180
};

// Smootherstep: 6t^5 - 15t^4 + 10t^3
inline double fade(double t) { return t * t * t * (t * (t * 6.0 - 15.0) + 10.0); }

inline double lerp(double a, double b, double t) { return a + t * (b - a); }

// Low 2 bits of the hash pick one of four diagonal gradients (±1, ±1)
inline double grad(int hash, double x, double y)
{
    return ((hash & 1) ? -x : x) + ((hash & 2) ? -y : y);
}

} // namespace

const std::array<uint8_t, 512>& NoiseField::permutation()
{
    static const std::array<uint8_t, 512> table = [] {
        std::array<uint8_t, 512> t {};
        for (int i = 0; i < 512; ++i)
            t[(size_t)i] = kReferencePerm[i & 255];
        return t;
    }();
    return table;
}

NoiseField::NoiseField()
    : perm_(permutation())
{
}

double NoiseField::noise2(double x, double y) const
{
    if (!std::isfinite(x) || !std::isfinite(y))
        return 0.0;

    double fx = std::floor(x);
    double fy = std::floor(y);
    int X = (int)((int64_t)std::fmod(fx, 256.0) & 255);
    int Y = (int)((int64_t)std::fmod(fy, 256.0) & 255);
    double xf = x - fx;
    double yf = y - fy;

    double u = fade(xf);
    double v = fade(yf);

    int a = perm_[(size_t)X] + Y;
    int b = perm_[(size_t)X + 1] + Y;
    int aa = perm_[(size_t)a];
    int ab = perm_[(size_t)a + 1];
    int ba = perm_[(size_t)b];
    int bb = perm_[(size_t)b + 1];

    double x1 = lerp(grad(aa, xf, yf),       grad(ba, xf - 1.0, yf),       u);
    double x2 = lerp(grad(ab, xf, yf - 1.0), grad(bb, xf - 1.0, yf - 1.0), u);
    return lerp(x1, x2, v);
}

double NoiseField::fbm(double x, double y, double t, const FbmParams& params) const
{
    int octaves = std::clamp(params.octaves, 0, MaxOctaves);

    double sum = 0.0;
    double norm = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;

    for (int o = 0; o < octaves; ++o) {
        double osc = 0.6 + 0.4 * std::sin(t * params.speed * (o + 1) + o * 1.7);
        double weight = amplitude * osc;
        sum  += noise2(x * frequency, y * frequency) * weight;
        norm += std::abs(weight);
        amplitude *= params.gain;
        frequency *= params.lacunarity;
    }

    if (norm == 0.0)
        return 0.0;
    return sum / norm;
}

} // namespace hexglow
