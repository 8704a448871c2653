#include "ImageSurface.h"

namespace hexglow {

ImageSurface::ImageSurface(int width, int height)
{
    setSize(width, height);
}

bool ImageSurface::isAvailable() const
{
    // A degenerate size is a layout state, not a missing context
    if (width_ <= 0 || height_ <= 0)
        return true;
    return image_.isValid();
}

void ImageSurface::setSize(int width, int height)
{
    graphics_.reset();
    width_ = width;
    height_ = height;

    if (width_ <= 0 || height_ <= 0) {
        image_ = juce::Image();
        return;
    }
    if (image_.isValid() && image_.getWidth() == width_ && image_.getHeight() == height_)
        return;

    image_ = juce::Image(juce::Image::ARGB, width_, height_, true, juce::SoftwareImageType());
}

bool ImageSurface::beginFrame()
{
    if (!image_.isValid())
        return false;
    graphics_ = std::make_unique<juce::Graphics>(image_);
    return true;
}

void ImageSurface::endFrame()
{
    graphics_.reset();
}

void ImageSurface::clear()
{
    if (image_.isValid())
        image_.clear(image_.getBounds());
}

void ImageSurface::fillVerticalGradient(juce::Colour top, juce::Colour bottom)
{
    if (!graphics_) return;
    juce::ColourGradient gradient(top, 0.0f, 0.0f, bottom, 0.0f, (float)height_, false);
    graphics_->setGradientFill(gradient);
    graphics_->fillRect(image_.getBounds());
}

void ImageSurface::fillPath(const juce::Path& path, juce::Colour colour)
{
    if (!graphics_) return;
    graphics_->setColour(colour);
    graphics_->fillPath(path);
}

void ImageSurface::strokePath(const juce::Path& path, juce::Colour colour, float width)
{
    if (!graphics_ || width <= 0.0f) return;
    graphics_->setColour(colour);
    graphics_->strokePath(path, juce::PathStrokeType(width));
}

} // namespace hexglow
