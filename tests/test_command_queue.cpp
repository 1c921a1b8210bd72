#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

#include "controller/Command.hpp"
#include "controller/CommandQueue.hpp"
#include "controller/InputAction.hpp"

using namespace blockdrop::controller;

TEST_CASE("CommandQueue drains in arrival order", "[queue]")
{
    CommandQueue q;
    REQUIRE(q.empty());

    q.push(Command::MoveLeft);
    q.push(Command::Tick);
    q.push(Command::Rotate);
    REQUIRE(q.size() == 3);

    const auto drained = q.drain();
    REQUIRE(drained == std::vector<Command>{Command::MoveLeft, Command::Tick, Command::Rotate});
    REQUIRE(q.empty());
    REQUIRE(q.drain().empty());
}

TEST_CASE("CommandQueue keeps each producer's order under concurrent pushes", "[queue]")
{
    CommandQueue q;
    constexpr int kCount = 500;

    std::thread gravity([&q] {
        for (int i = 0; i < kCount; ++i) q.push(Command::Tick);
    });
    std::thread input([&q] {
        for (int i = 0; i < kCount; ++i) {
            q.push(i % 2 == 0 ? Command::MoveLeft : Command::MoveRight);
        }
    });
    gravity.join();
    input.join();

    const auto drained = q.drain();
    REQUIRE(drained.size() == 2 * kCount);

    // Input commands must still alternate left/right in the merged stream
    int inputSeen = 0;
    for (Command c : drained) {
        if (c == Command::Tick) continue;
        const Command expected = (inputSeen % 2 == 0) ? Command::MoveLeft : Command::MoveRight;
        REQUIRE(c == expected);
        ++inputSeen;
    }
    REQUIRE(inputSeen == kCount);
}

TEST_CASE("Input actions map onto engine commands", "[queue]")
{
    REQUIRE(toCommand(InputAction::MoveLeft) == Command::MoveLeft);
    REQUIRE(toCommand(InputAction::MoveRight) == Command::MoveRight);
    REQUIRE(toCommand(InputAction::MoveDown) == Command::MoveDown);
    REQUIRE(toCommand(InputAction::Rotate) == Command::Rotate);
    REQUIRE(toCommand(InputAction::PauseResume) == Command::TogglePause);
    REQUIRE(toCommand(InputAction::Restart) == Command::Reset);
}
