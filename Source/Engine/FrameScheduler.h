#pragma once

#include <functional>

namespace hexglow {

// ============================================================
// FrameScheduler: "call me on the next frame" plus cancellation.
// At most one frame is pending; a new request replaces the old one.
// ============================================================
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    virtual void requestFrame(std::function<void()> callback) = 0;

    // Drops the pending callback; it must never run afterwards
    virtual void cancelFrame() = 0;

    virtual bool hasPendingFrame() const = 0;
};

} // namespace hexglow
