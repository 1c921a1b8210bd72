#pragma once

namespace blockdrop::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, terminal, scripted, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    MoveDown,
    Rotate,
    PauseResume,
    Restart
};

} // namespace blockdrop::controller
