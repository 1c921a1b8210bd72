#pragma once

#include "controller/InputAction.hpp"

namespace blockdrop::controller {

// Everything that can be applied to a GameState, whichever producer sent it.
// Tick comes from the gravity timer, the rest from player input.
enum class Command {
    Tick,
    MoveLeft,
    MoveRight,
    MoveDown,
    Rotate,
    TogglePause,
    Reset
};

inline Command toCommand(InputAction action) noexcept {
    switch (action) {
    case InputAction::MoveLeft:    return Command::MoveLeft;
    case InputAction::MoveRight:   return Command::MoveRight;
    case InputAction::MoveDown:    return Command::MoveDown;
    case InputAction::Rotate:      return Command::Rotate;
    case InputAction::PauseResume: return Command::TogglePause;
    case InputAction::Restart:     return Command::Reset;
    }
    return Command::Tick;
}

} // namespace blockdrop::controller
