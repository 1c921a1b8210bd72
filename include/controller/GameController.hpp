#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include "controller/CommandQueue.hpp"
#include <chrono>
#include <cstddef>

namespace blockdrop::controller {

class GameController {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;

    /// Controller does not own the GameState; caller keeps it alive.
    /// Only the thread that calls update()/processPending() touches it.
    explicit GameController(blockdrop::core::GameState& game);

    /// Queue a player action. Safe to call from any thread.
    void post(InputAction action);

    /// Queue a player action and apply everything pending right away.
    /// For hosts whose input already arrives on the owner thread.
    void handleAction(InputAction action);

    // Called periodically with elapsed time since last call.
    // Spawns the first piece if there is none, turns the accumulated time
    // into gravity ticks on the queue, then applies every pending command.
    void update(Duration elapsed);

    /// Apply pending commands in arrival order. Returns how many were applied.
    std::size_t processPending();

    // Reset timing accumulator (e.g. when game is reset)
    void resetTiming();

    /// Read-only view of pending commands, used by tests.
    const CommandQueue& queue() const noexcept { return queue_; }

private:
    blockdrop::core::GameState& game_;
    CommandQueue queue_;
    Duration accumulated_{0};

    void apply(Command command);
};

} // namespace blockdrop::controller
