#pragma once

#include <juce_graphics/juce_graphics.h>

namespace hexglow {

// ============================================================
// Per-channel linear blend between two colours, t in [0,1]
// ============================================================
inline juce::Colour lerpColour(juce::Colour a, juce::Colour b, float t)
{
    t = juce::jlimit(0.0f, 1.0f, t);
    auto mix = [t](juce::uint8 from, juce::uint8 to) {
        return (juce::uint8)juce::roundToInt((float)from + ((float)to - (float)from) * t);
    };
    return juce::Colour::fromRGB(mix(a.getRed(),   b.getRed()),
                                 mix(a.getGreen(), b.getGreen()),
                                 mix(a.getBlue(),  b.getBlue()));
}

// "#rrggbb" or "rrggbb" -> opaque colour; malformed text gives the fallback
inline juce::Colour parseColour(const juce::String& text, juce::Colour fallback)
{
    auto hex = text.trim();
    if (hex.startsWithChar('#'))
        hex = hex.substring(1);
    if (hex.length() != 6 || !hex.containsOnly("0123456789abcdefABCDEF"))
        return fallback;

    auto v = hex.getHexValue32();
    return juce::Colour::fromRGB((juce::uint8)((v >> 16) & 0xff),
                                 (juce::uint8)((v >> 8) & 0xff),
                                 (juce::uint8)(v & 0xff));
}

inline juce::String colourToString(juce::Colour c)
{
    return "#" + c.toDisplayString(false).toLowerCase();
}

// ============================================================
// Default palette (light grey page, dark glowing cells)
// ============================================================
namespace Palette {
    inline const juce::Colour BackgroundTop    {0xffe8e8e8};
    inline const juce::Colour BackgroundBottom {0xffdedede};
    inline const juce::Colour FillLow          {0xff5a5a5a};
    inline const juce::Colour FillHigh         {0xff323232};
    inline const juce::Colour Outline          {0xff000000};
}

} // namespace hexglow
