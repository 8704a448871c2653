#pragma once

#include <juce_graphics/juce_graphics.h>

namespace hexglow {

// ============================================================
// Surface: the drawable the engine paints each frame.
// Draw calls are only valid between beginFrame() and endFrame().
// ============================================================
class Surface {
public:
    virtual ~Surface() = default;

    // False when no drawing context can be obtained at all
    virtual bool isAvailable() const = 0;

    virtual void setSize(int width, int height) = 0;
    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;

    // False if the drawing context could not be acquired for this frame
    virtual bool beginFrame() = 0;
    virtual void endFrame() = 0;

    virtual void clear() = 0;
    virtual void fillVerticalGradient(juce::Colour top, juce::Colour bottom) = 0;
    virtual void fillPath(const juce::Path& path, juce::Colour colour) = 0;
    virtual void strokePath(const juce::Path& path, juce::Colour colour, float width) = 0;
};

} // namespace hexglow
