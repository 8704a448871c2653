#pragma once

#include "FrameScheduler.h"
#include "../Effects/FillController.h"
#include "../Effects/RippleSystem.h"
#include "../Grid/HexGrid.h"
#include "../Model/EngineConfig.h"
#include "../Noise/NoiseField.h"
#include "../Rendering/Surface.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace hexglow {

// ============================================================
// HexEngine: owns grid, noise, ripples and the frame loop.
// Host notifications only record state; the next tick applies it.
// ============================================================
class HexEngine {
public:
    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void frameRendered() {}
        virtual void engineFailed(const juce::String& /*reason*/) {}
    };

    explicit HexEngine(FrameScheduler& scheduler);
    ~HexEngine();

    // Fails (and schedules nothing) if the surface is null or unavailable
    bool start(Surface* surface, const EngineConfig& config);
    void stop();
    bool isRunning() const { return running_; }

    // Host notifications
    void surfaceResized(int width, int height);
    void pointerMoved(double x, double y);
    void pointerLeft();

    void addListener(Listener* l);
    void removeListener(Listener* l);

    const HexGrid& getGrid() const { return grid_; }
    const RippleSystem& getRippleSystem() const { return ripples_; }
    RippleSystem& getRippleSystem() { return ripples_; }
    const EngineConfig& getConfig() const { return config_; }
    int64_t getFrameIndex() const { return frameIndex_; }
    juce::Point<double> getPointer() const { return pointer_; }
    bool isResizePending() const { return resizePending_; }

    // Seconds of animation time at the current frame
    double getTime() const;

private:
    void tick();
    void scheduleNextFrame();
    void applyPendingState();
    void rebuild(int width, int height);
    void drawCells();
    void fail(const juce::String& reason);
    std::unique_ptr<TargetFillStrategy> makeStrategy() const;

    FrameScheduler& scheduler_;
    Surface* surface_ = nullptr;
    EngineConfig config_;

    NoiseField noise_;
    HexGrid grid_;
    RippleSystem ripples_;
    std::unique_ptr<TargetFillStrategy> strategy_;

    bool running_ = false;
    int64_t frameIndex_ = 0;
    juce::Point<double> pointer_ {PointerOffscreen, PointerOffscreen};

    // Written by host events between ticks
    bool resizePending_ = false;
    int pendingWidth_ = 0, pendingHeight_ = 0;
    juce::Point<double> pendingPointer_ {PointerOffscreen, PointerOffscreen};

    std::vector<Listener*> listeners_;

    JUCE_DECLARE_NON_COPYABLE(HexEngine)
};

} // namespace hexglow
