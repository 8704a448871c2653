#pragma once

#include "Color.h"
#include "../Effects/FillController.h"
#include "../Effects/RippleSystem.h"
#include "../Noise/NoiseField.h"
#include <juce_core/juce_core.h>
#include <string>

namespace hexglow {

// ============================================================
// Fill mode: which TargetFillStrategy the engine runs
// ============================================================
enum class FillMode { Ambient, Interactive };

inline FillMode fillModeFromString(const std::string& s)
{
    if (s == "ambient") return FillMode::Ambient;
    if (s != "interactive") {
        DBG("[config] Unknown mode \"" + juce::String(s) + "\", using interactive");
    }
    return FillMode::Interactive;
}

inline std::string fillModeToString(FillMode m)
{
    switch (m) {
        case FillMode::Ambient:     return "ambient";
        case FillMode::Interactive: return "interactive";
    }
    return "interactive";
}

// ============================================================
// EngineConfig: everything the host can tune, with defaults
// ============================================================
struct EngineConfig {
    FillMode mode = FillMode::Interactive;

    // Geometry and colours
    double hexRadius = 15.0;
    juce::Colour minColor         = Palette::FillLow;
    juce::Colour maxColor         = Palette::FillHigh;
    juce::Colour backgroundTop    = Palette::BackgroundTop;
    juce::Colour backgroundBottom = Palette::BackgroundBottom;
    juce::Colour outlineColor     = Palette::Outline;
    float outlineWidth = 1.5f;
    double visibilityThreshold = 0.01;
    bool fillAlphaFollowsLevel = true;

    // Noise shaping (ambient mode)
    int octaves       = 3;
    double lacunarity = 2.0;
    double gain       = 0.5;
    double baseScale  = 0.01;
    double speed      = 0.35;
    double padding    = 0.05;
    double gamma      = 1.1;

    // Ripple shaping (interactive mode)
    int rippleCap      = 8;
    int spawnInterval  = 60;
    int spawnMin       = 1;
    int spawnMax       = 2;
    int initialRipples = 3;
    double ringWidth     = 40.0;
    double pointerRadius = 120.0;

    // Smoothing
    double attackRate  = 0.08;
    double releaseRate = 0.03;

    // Loop
    int frameIntervalMs = 16;
    uint32_t seed = 12345;

    // Copy with every field forced into its usable range; attack always
    // ends up faster than release
    EngineConfig sanitised() const;

    FbmParams fbmParams() const;
    AmbientParams ambientParams() const;
    RippleParams rippleParams() const;
    SmoothingParams smoothingParams() const;

    // JSON (snake_case keys, "#rrggbb" colours); missing keys keep defaults
    juce::var toVar() const;
    static EngineConfig fromVar(const juce::var& v);
    juce::String toJSON() const;
    static bool fromJSON(const juce::String& json, EngineConfig& out);

    bool saveToFile(const juce::File& file) const;
    static bool loadFromFile(const juce::File& file, EngineConfig& out);
};

} // namespace hexglow
