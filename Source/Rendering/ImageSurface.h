#pragma once

#include "Surface.h"
#include <memory>

namespace hexglow {

// ============================================================
// ImageSurface: software ARGB image the host blits in paint()
// ============================================================
class ImageSurface : public Surface {
public:
    ImageSurface() = default;
    ImageSurface(int width, int height);

    bool isAvailable() const override;

    void setSize(int width, int height) override;
    int getWidth() const override  { return width_; }
    int getHeight() const override { return height_; }

    bool beginFrame() override;
    void endFrame() override;

    void clear() override;
    void fillVerticalGradient(juce::Colour top, juce::Colour bottom) override;
    void fillPath(const juce::Path& path, juce::Colour colour) override;
    void strokePath(const juce::Path& path, juce::Colour colour, float width) override;

    // Last completed frame (null image while the size is degenerate)
    const juce::Image& getImage() const { return image_; }

private:
    juce::Image image_;
    std::unique_ptr<juce::Graphics> graphics_;
    int width_ = 0, height_ = 0;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ImageSurface)
};

} // namespace hexglow
