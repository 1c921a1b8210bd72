#include "controller/FrameTimer.hpp"

namespace blockdrop::controller {

FrameTimer::FrameTimer(Clock::time_point start)
    : last_{start}
{
}

FrameTimer::Duration FrameTimer::advance(Clock::time_point now)
{
    if (now <= last_) {
        return Duration{0};
    }

    const auto elapsed = std::chrono::duration_cast<Duration>(now - last_);
    last_ += elapsed;
    return elapsed;
}

void FrameTimer::restart(Clock::time_point now)
{
    last_ = now;
}

} // namespace blockdrop::controller
