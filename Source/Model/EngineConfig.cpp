#include "EngineConfig.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace hexglow {

// ============================================================
// Range enforcement
// ============================================================
EngineConfig EngineConfig::sanitised() const
{
    EngineConfig c = *this;

    auto finiteOr = [](double v, double def) { return std::isfinite(v) ? v : def; };

    c.hexRadius    = juce::jlimit(2.0, 500.0, finiteOr(c.hexRadius, 15.0));
    c.outlineWidth = juce::jlimit(0.0f, 20.0f, std::isfinite(c.outlineWidth) ? c.outlineWidth : 1.5f);
    c.visibilityThreshold = juce::jlimit(0.0, 1.0, finiteOr(c.visibilityThreshold, 0.01));

    c.octaves    = juce::jlimit(0, NoiseField::MaxOctaves, c.octaves);
    c.lacunarity = juce::jlimit(1.0, 8.0, finiteOr(c.lacunarity, 2.0));
    c.gain       = juce::jlimit(0.0, 1.0, finiteOr(c.gain, 0.5));
    c.baseScale  = juce::jlimit(0.0, 10.0, finiteOr(c.baseScale, 0.01));
    c.speed      = juce::jlimit(0.0, 100.0, finiteOr(c.speed, 0.35));
    c.padding    = juce::jlimit(0.0, 0.45, finiteOr(c.padding, 0.05));
    c.gamma      = juce::jlimit(0.1, 10.0, finiteOr(c.gamma, 1.1));

    c.rippleCap      = juce::jlimit(0, 256, c.rippleCap);
    c.spawnInterval  = juce::jlimit(0, 100000, c.spawnInterval);
    c.spawnMin       = juce::jlimit(0, 64, c.spawnMin);
    c.spawnMax       = juce::jlimit(c.spawnMin, 64, c.spawnMax);
    c.initialRipples = juce::jlimit(0, 64, c.initialRipples);
    c.ringWidth      = juce::jlimit(1.0, 10000.0, finiteOr(c.ringWidth, 40.0));
    c.pointerRadius  = juce::jlimit(0.0, 10000.0, finiteOr(c.pointerRadius, 120.0));

    c.attackRate  = juce::jlimit(0.001, 1.0, finiteOr(c.attackRate, 0.08));
    c.releaseRate = juce::jlimit(0.001, 1.0, finiteOr(c.releaseRate, 0.03));
    if (c.attackRate < c.releaseRate)
        std::swap(c.attackRate, c.releaseRate);
    if (c.attackRate == c.releaseRate)
        c.releaseRate = c.attackRate * 0.5;

    c.frameIntervalMs = juce::jlimit(1, 1000, c.frameIntervalMs);
    return c;
}

// ============================================================
// Per-module parameter views
// ============================================================
FbmParams EngineConfig::fbmParams() const
{
    FbmParams p;
    p.octaves    = octaves;
    p.lacunarity = lacunarity;
    p.gain       = gain;
    p.speed      = speed;
    return p;
}

AmbientParams EngineConfig::ambientParams() const
{
    AmbientParams p;
    p.fbm       = fbmParams();
    p.baseScale = baseScale;
    p.padding   = padding;
    p.gamma     = gamma;
    return p;
}

RippleParams EngineConfig::rippleParams() const
{
    RippleParams p;
    p.cap            = rippleCap;
    p.spawnInterval  = spawnInterval;
    p.spawnMin       = spawnMin;
    p.spawnMax       = spawnMax;
    p.initialRipples = initialRipples;
    p.ringWidth      = ringWidth;
    return p;
}

SmoothingParams EngineConfig::smoothingParams() const
{
    SmoothingParams p;
    p.attackRate  = attackRate;
    p.releaseRate = releaseRate;
    return p;
}

// ============================================================
// JSON
// ============================================================
juce::var EngineConfig::toVar() const
{
    auto obj = new juce::DynamicObject();
    obj->setProperty("mode", juce::String(fillModeToString(mode)));
    obj->setProperty("hex_radius", hexRadius);
    obj->setProperty("min_color", colourToString(minColor));
    obj->setProperty("max_color", colourToString(maxColor));
    obj->setProperty("background_top", colourToString(backgroundTop));
    obj->setProperty("background_bottom", colourToString(backgroundBottom));
    obj->setProperty("outline_color", colourToString(outlineColor));
    obj->setProperty("outline_width", (double)outlineWidth);
    obj->setProperty("visibility_threshold", visibilityThreshold);
    obj->setProperty("fill_alpha_follows_level", fillAlphaFollowsLevel);

    obj->setProperty("octaves", octaves);
    obj->setProperty("lacunarity", lacunarity);
    obj->setProperty("gain", gain);
    obj->setProperty("base_scale", baseScale);
    obj->setProperty("speed", speed);
    obj->setProperty("padding", padding);
    obj->setProperty("gamma", gamma);

    obj->setProperty("ripple_cap", rippleCap);
    obj->setProperty("spawn_interval", spawnInterval);
    obj->setProperty("spawn_min", spawnMin);
    obj->setProperty("spawn_max", spawnMax);
    obj->setProperty("initial_ripples", initialRipples);
    obj->setProperty("ring_width", ringWidth);
    obj->setProperty("pointer_radius", pointerRadius);

    obj->setProperty("attack_rate", attackRate);
    obj->setProperty("release_rate", releaseRate);

    obj->setProperty("frame_interval_ms", frameIntervalMs);
    obj->setProperty("seed", (juce::int64)seed);
    return juce::var(obj);
}

EngineConfig EngineConfig::fromVar(const juce::var& v)
{
    EngineConfig c;
    auto* obj = v.getDynamicObject();
    if (!obj)
        return c;

    auto getStr = [&](const char* key, const juce::String& def) -> juce::String {
        if (obj->hasProperty(key))
            return obj->getProperty(key).toString();
        return def;
    };
    auto getDouble = [&](const char* key, double def) -> double {
        if (obj->hasProperty(key))
            return (double)obj->getProperty(key);
        return def;
    };
    // JSON numbers arrive as int, int64 or double; clamp before narrowing
    auto getWhole = [&](const char* key, double def, double lo, double hi) -> double {
        if (!obj->hasProperty(key))
            return def;
        auto v = (double)obj->getProperty(key);
        return std::isfinite(v) ? juce::jlimit(lo, hi, v) : def;
    };
    auto getInt = [&](const char* key, int def) -> int {
        return (int)getWhole(key, def, (double)std::numeric_limits<int>::min(),
                             (double)std::numeric_limits<int>::max());
    };
    auto getBool = [&](const char* key, bool def) -> bool {
        if (obj->hasProperty(key))
            return (bool)obj->getProperty(key);
        return def;
    };
    auto getColour = [&](const char* key, juce::Colour def) -> juce::Colour {
        if (obj->hasProperty(key))
            return parseColour(obj->getProperty(key).toString(), def);
        return def;
    };

    c.mode                  = fillModeFromString(getStr("mode", "interactive").toStdString());
    c.hexRadius             = getDouble("hex_radius", c.hexRadius);
    c.minColor              = getColour("min_color", c.minColor);
    c.maxColor              = getColour("max_color", c.maxColor);
    c.backgroundTop         = getColour("background_top", c.backgroundTop);
    c.backgroundBottom      = getColour("background_bottom", c.backgroundBottom);
    c.outlineColor          = getColour("outline_color", c.outlineColor);
    c.outlineWidth          = (float)getDouble("outline_width", c.outlineWidth);
    c.visibilityThreshold   = getDouble("visibility_threshold", c.visibilityThreshold);
    c.fillAlphaFollowsLevel = getBool("fill_alpha_follows_level", c.fillAlphaFollowsLevel);

    c.octaves    = getInt("octaves", c.octaves);
    c.lacunarity = getDouble("lacunarity", c.lacunarity);
    c.gain       = getDouble("gain", c.gain);
    c.baseScale  = getDouble("base_scale", c.baseScale);
    c.speed      = getDouble("speed", c.speed);
    c.padding    = getDouble("padding", c.padding);
    c.gamma      = getDouble("gamma", c.gamma);

    c.rippleCap      = getInt("ripple_cap", c.rippleCap);
    c.spawnInterval  = getInt("spawn_interval", c.spawnInterval);
    c.spawnMin       = getInt("spawn_min", c.spawnMin);
    c.spawnMax       = getInt("spawn_max", c.spawnMax);
    c.initialRipples = getInt("initial_ripples", c.initialRipples);
    c.ringWidth      = getDouble("ring_width", c.ringWidth);
    c.pointerRadius  = getDouble("pointer_radius", c.pointerRadius);

    c.attackRate  = getDouble("attack_rate", c.attackRate);
    c.releaseRate = getDouble("release_rate", c.releaseRate);

    c.frameIntervalMs = getInt("frame_interval_ms", c.frameIntervalMs);
    c.seed = (uint32_t)getWhole("seed", c.seed, 0.0, (double)std::numeric_limits<uint32_t>::max());

    return c;
}

juce::String EngineConfig::toJSON() const
{
    return juce::JSON::toString(toVar());
}

bool EngineConfig::fromJSON(const juce::String& json, EngineConfig& out)
{
    juce::var parsed;
    auto result = juce::JSON::parse(json, parsed);
    if (result.failed() || !parsed.isObject()) {
        DBG("[config] Invalid JSON: " + result.getErrorMessage());
        return false;
    }
    out = fromVar(parsed);
    return true;
}

bool EngineConfig::saveToFile(const juce::File& file) const
{
    return file.replaceWithText(toJSON());
}

bool EngineConfig::loadFromFile(const juce::File& file, EngineConfig& out)
{
    if (!file.existsAsFile()) {
        DBG("[config] No such file: " + file.getFullPathName());
        return false;
    }
    return fromJSON(file.loadFileAsString(), out);
}

} // namespace hexglow
