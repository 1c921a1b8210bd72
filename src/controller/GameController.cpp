#include "controller/GameController.hpp"

namespace blockdrop::controller {

GameController::GameController(blockdrop::core::GameState& game)
    : game_{game}
{
}

void GameController::post(InputAction action)
{
    queue_.push(toCommand(action));
}

void GameController::handleAction(InputAction action)
{
    post(action);
    processPending();
}

void GameController::update(Duration elapsed)
{
    using core::GameStatus;

    // Spawn opportunity after construction or reset
    if (!game_.activePiece() && !game_.isGameOver()) {
        game_.start();
    }

    if (game_.status() == GameStatus::Running) {
        const int intervalMs = game_.gravityIntervalMs();
        if (intervalMs > 0) {
            accumulated_ += elapsed;

            Duration interval{intervalMs};

            // If a lot of time passed (lag), we might need several ticks
            while (accumulated_ >= interval) {
                queue_.push(Command::Tick);
                accumulated_ -= interval;
            }
        }
    }

    processPending();
}

std::size_t GameController::processPending()
{
    const auto commands = queue_.drain();
    for (Command command : commands) {
        apply(command);
    }
    return commands.size();
}

void GameController::resetTiming()
{
    accumulated_ = Duration{0};
}

void GameController::apply(Command command)
{
    switch (command) {
    case Command::Tick:
    case Command::MoveDown:
        game_.tick();
        break;
    case Command::MoveLeft:
        game_.moveLeft();
        break;
    case Command::MoveRight:
        game_.moveRight();
        break;
    case Command::Rotate:
        game_.rotate();
        break;
    case Command::TogglePause:
        game_.togglePause();
        break;
    case Command::Reset:
        game_.reset();
        game_.start();
        accumulated_ = Duration{0};
        break;
    }
}

} // namespace blockdrop::controller
