#pragma once

#include "FrameScheduler.h"
#include <juce_events/juce_events.h>

namespace hexglow {

// One-shot juce::Timer on the message thread
class TimerFrameScheduler : public FrameScheduler,
                            private juce::Timer {
public:
    explicit TimerFrameScheduler(int intervalMs = 16);
    ~TimerFrameScheduler() override;

    void setInterval(int intervalMs);
    int getInterval() const { return intervalMs_; }

    void requestFrame(std::function<void()> callback) override;
    void cancelFrame() override;
    bool hasPendingFrame() const override { return pending_ != nullptr; }

private:
    void timerCallback() override;

    std::function<void()> pending_;
    int intervalMs_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TimerFrameScheduler)
};

} // namespace hexglow
