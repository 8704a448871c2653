#include "HexEngine.h"
#include "../Model/Color.h"
#include <algorithm>

namespace hexglow {

HexEngine::HexEngine(FrameScheduler& scheduler)
    : scheduler_(scheduler)
{
}

HexEngine::~HexEngine()
{
    stop();
}

// ============================================================
// Lifecycle
// ============================================================

bool HexEngine::start(Surface* surface, const EngineConfig& config)
{
    stop();

    if (surface == nullptr || !surface->isAvailable()) {
        DBG("[engine] Start refused: drawing surface unavailable");
        return false;
    }

    surface_ = surface;
    config_ = config.sanitised();
    frameIndex_ = 0;
    pointer_ = pendingPointer_;

    ripples_ = RippleSystem(config_.seed);
    ripples_.setParams(config_.rippleParams());
    rebuild(surface_->getWidth(), surface_->getHeight());
    strategy_ = makeStrategy();

    running_ = true;
    DBG("[engine] Started (" + juce::String(fillModeToString(config_.mode)) + ", "
        + juce::String((int)grid_.size()) + " cells)");
    scheduleNextFrame();
    return true;
}

void HexEngine::stop()
{
    scheduler_.cancelFrame();
    if (!running_)
        return;

    running_ = false;
    surface_ = nullptr;
    DBG("[engine] Stopped after " + juce::String((juce::int64)frameIndex_) + " frames");
}

std::unique_ptr<TargetFillStrategy> HexEngine::makeStrategy() const
{
    if (config_.mode == FillMode::Ambient)
        return std::make_unique<AmbientNoiseFill>(noise_, config_.ambientParams());
    return std::make_unique<PointerRippleFill>(ripples_, config_.pointerRadius);
}

void HexEngine::fail(const juce::String& reason)
{
    DBG("[engine] Failure: " + reason);
    stop();

    auto listeners = listeners_;
    for (auto* l : listeners)
        l->engineFailed(reason);
}

void HexEngine::scheduleNextFrame()
{
    scheduler_.requestFrame([this] { tick(); });
}

double HexEngine::getTime() const
{
    return (double)frameIndex_ * config_.frameIntervalMs / 1000.0;
}

// ============================================================
// Host notifications
// ============================================================

void HexEngine::surfaceResized(int width, int height)
{
    pendingWidth_ = width;
    pendingHeight_ = height;
    resizePending_ = true;
}

void HexEngine::pointerMoved(double x, double y)
{
    pendingPointer_ = {x, y};
}

void HexEngine::pointerLeft()
{
    pendingPointer_ = {PointerOffscreen, PointerOffscreen};
}

void HexEngine::addListener(Listener* l)
{
    if (std::find(listeners_.begin(), listeners_.end(), l) == listeners_.end())
        listeners_.push_back(l);
}

void HexEngine::removeListener(Listener* l)
{
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), l), listeners_.end());
}

// ============================================================
// Frame
// ============================================================

void HexEngine::applyPendingState()
{
    if (resizePending_) {
        resizePending_ = false;
        surface_->setSize(pendingWidth_, pendingHeight_);
        rebuild(surface_->getWidth(), surface_->getHeight());
        DBG("[engine] Resized to " + juce::String(surface_->getWidth()) + "x"
            + juce::String(surface_->getHeight()) + ", " + juce::String((int)grid_.size()) + " cells");
    }
    pointer_ = pendingPointer_;
}

void HexEngine::rebuild(int width, int height)
{
    grid_ = HexGrid::build((double)width, (double)height, config_.hexRadius);
    if (config_.mode == FillMode::Interactive)
        ripples_.seed((double)width, (double)height);
    else
        ripples_.clear();
}

void HexEngine::tick()
{
    if (!running_ || surface_ == nullptr)
        return;

    applyPendingState();
    ++frameIndex_;

    int w = surface_->getWidth();
    int h = surface_->getHeight();
    if (w <= 0 || h <= 0 || grid_.empty()) {
        scheduleNextFrame();
        return;
    }

    if (!surface_->beginFrame()) {
        fail("Drawing surface unavailable");
        return;
    }

    surface_->clear();
    surface_->fillVerticalGradient(config_.backgroundTop, config_.backgroundBottom);

    if (config_.mode == FillMode::Interactive)
        ripples_.advance(frameIndex_, (double)w, (double)h);

    strategy_->beginFrame(getTime(), pointer_);
    FillController::update(grid_.cells(), *strategy_, config_.smoothingParams());
    drawCells();

    surface_->endFrame();
    scheduleNextFrame();

    auto listeners = listeners_;
    for (auto* l : listeners)
        l->frameRendered();
}

void HexEngine::drawCells()
{
    for (auto& cell : grid_.cells()) {
        auto path = grid_.hexPath(cell);

        if (cell.fillLevel > config_.visibilityThreshold) {
            auto level = (float)cell.fillLevel;
            auto colour = lerpColour(config_.minColor, config_.maxColor, level);
            if (config_.fillAlphaFollowsLevel)
                colour = colour.withAlpha(level);
            surface_->fillPath(path, colour);
        }

        surface_->strokePath(path, config_.outlineColor, config_.outlineWidth);
    }
}

} // namespace hexglow
