#pragma once

#include <chrono>

namespace blockdrop::controller {

// Turns wall-clock readings into whole-millisecond steps for
// GameController::update(). The sub-millisecond part of each step is
// carried into the next one, so no time is lost over many frames.
class FrameTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;

    explicit FrameTimer(Clock::time_point start = Clock::now());

    // Whole milliseconds since the previous call (or since start/restart).
    // A reading earlier than the last one yields zero.
    Duration advance(Clock::time_point now = Clock::now());

    void restart(Clock::time_point now = Clock::now());

private:
    Clock::time_point last_;
};

} // namespace blockdrop::controller
