#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include "../Engine/HexEngine.h"
#include "../Engine/TimerFrameScheduler.h"
#include "../Model/EngineConfig.h"
#include "../Rendering/ImageSurface.h"

namespace hexglow {

// ============================================================
// HexBackgroundComponent: hosts a HexEngine for its lifetime.
// Construction starts the engine; destruction stops it before the
// surface and scheduler go away.
// ============================================================
class HexBackgroundComponent : public juce::Component,
                               private HexEngine::Listener {
public:
    explicit HexBackgroundComponent(const EngineConfig& config = {});
    ~HexBackgroundComponent() override;

    void paint(juce::Graphics& g) override;
    void resized() override;
    void mouseMove(const juce::MouseEvent& e) override;
    void mouseDrag(const juce::MouseEvent& e) override;
    void mouseExit(const juce::MouseEvent& e) override;

    // Restart with new settings; returns false if the engine refused
    bool setConfig(const EngineConfig& config);
    const EngineConfig& getConfig() const { return config_; }

    bool hasFailed() const { return failure_.isNotEmpty(); }
    const juce::String& getFailure() const { return failure_; }

private:
    // HexEngine::Listener
    void frameRendered() override;
    void engineFailed(const juce::String& reason) override;

    EngineConfig config_;
    TimerFrameScheduler scheduler_;
    ImageSurface surface_;
    HexEngine engine_;  // last member: destroyed first
    juce::String failure_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(HexBackgroundComponent)
};

} // namespace hexglow
