#include "HexBackgroundComponent.h"

namespace hexglow {

HexBackgroundComponent::HexBackgroundComponent(const EngineConfig& config)
    : config_(config.sanitised()),
      scheduler_(config_.frameIntervalMs),
      engine_(scheduler_)
{
    setOpaque(true);
    engine_.addListener(this);
    setConfig(config_);
}

HexBackgroundComponent::~HexBackgroundComponent()
{
    engine_.removeListener(this);
    engine_.stop();
}

bool HexBackgroundComponent::setConfig(const EngineConfig& config)
{
    config_ = config.sanitised();
    failure_.clear();
    scheduler_.setInterval(config_.frameIntervalMs);
    engine_.surfaceResized(getWidth(), getHeight());

    if (!engine_.start(&surface_, config_)) {
        failure_ = "Drawing surface unavailable";
        repaint();
        return false;
    }
    return true;
}

// ============================================================
// Painting
// ============================================================

void HexBackgroundComponent::paint(juce::Graphics& g)
{
    auto& image = surface_.getImage();
    if (hasFailed() || !image.isValid()) {
        g.fillAll(config_.backgroundTop);
        return;
    }
    g.drawImageAt(image, 0, 0);
}

void HexBackgroundComponent::frameRendered()
{
    repaint();
}

void HexBackgroundComponent::engineFailed(const juce::String& reason)
{
    failure_ = reason;
    DBG("[ui] Background stopped: " + reason);
    repaint();
}

// ============================================================
// Host events: recorded by the engine, applied next frame
// ============================================================

void HexBackgroundComponent::resized()
{
    engine_.surfaceResized(getWidth(), getHeight());
}

void HexBackgroundComponent::mouseMove(const juce::MouseEvent& e)
{
    engine_.pointerMoved((double)e.position.x, (double)e.position.y);
}

void HexBackgroundComponent::mouseDrag(const juce::MouseEvent& e)
{
    engine_.pointerMoved((double)e.position.x, (double)e.position.y);
}

void HexBackgroundComponent::mouseExit(const juce::MouseEvent&)
{
    engine_.pointerLeft();
}

} // namespace hexglow
