#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "controller/FrameTimer.hpp"

using blockdrop::controller::FrameTimer;
using namespace std::chrono_literals;

TEST_CASE("FrameTimer reports whole milliseconds between readings", "[timer]")
{
    const auto t0 = FrameTimer::Clock::time_point{};
    FrameTimer timer{t0};

    REQUIRE(timer.advance(t0 + 16ms) == FrameTimer::Duration{16});
    REQUIRE(timer.advance(t0 + 50ms) == FrameTimer::Duration{34});
    REQUIRE(timer.advance(t0 + 50ms) == FrameTimer::Duration{0});
}

TEST_CASE("FrameTimer carries sub-millisecond remainders forward", "[timer]")
{
    const auto t0 = FrameTimer::Clock::time_point{};
    FrameTimer timer{t0};

    // Sixty 16.6 ms frames: rounding each one down would lose 36 ms
    FrameTimer::Duration total{0};
    for (int frame = 1; frame <= 60; ++frame) {
        total += timer.advance(t0 + frame * 16600us);
    }
    REQUIRE(total == FrameTimer::Duration{996});
}

TEST_CASE("FrameTimer ignores readings that go backwards and can restart", "[timer]")
{
    const auto t0 = FrameTimer::Clock::time_point{} + 1s;
    FrameTimer timer{t0};

    REQUIRE(timer.advance(t0 - 5ms) == FrameTimer::Duration{0});
    REQUIRE(timer.advance(t0 + 10ms) == FrameTimer::Duration{10});

    // Time spent away (e.g. a paused window) is not owed after a restart
    timer.restart(t0 + 10s);
    REQUIRE(timer.advance(t0 + 10s + 20ms) == FrameTimer::Duration{20});
}
