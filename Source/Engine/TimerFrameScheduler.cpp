#include "TimerFrameScheduler.h"

namespace hexglow {

TimerFrameScheduler::TimerFrameScheduler(int intervalMs)
    : intervalMs_(juce::jmax(1, intervalMs))
{
}

TimerFrameScheduler::~TimerFrameScheduler()
{
    stopTimer();
}

void TimerFrameScheduler::setInterval(int intervalMs)
{
    intervalMs_ = juce::jmax(1, intervalMs);
    if (isTimerRunning())
        startTimer(intervalMs_);
}

void TimerFrameScheduler::requestFrame(std::function<void()> callback)
{
    pending_ = std::move(callback);
    if (pending_ != nullptr)
        startTimer(intervalMs_);
    else
        stopTimer();
}

void TimerFrameScheduler::cancelFrame()
{
    stopTimer();
    pending_ = nullptr;
}

void TimerFrameScheduler::timerCallback()
{
    stopTimer();
    auto callback = std::move(pending_);
    pending_ = nullptr;
    if (callback)
        callback();
}

} // namespace hexglow
