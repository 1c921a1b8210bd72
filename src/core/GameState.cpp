#include "core/GameState.hpp"
#include <utility>

namespace blockdrop::core {

namespace {

PieceCatalogue catalogueFor(const GameConfig& config) {
    if (config.seed) {
        return PieceCatalogue{*config.seed};
    }
    return PieceCatalogue{};
}

} // namespace

GameState::GameState(const GameConfig& config)
    : GameState(catalogueFor(config), config)
{
}

GameState::GameState(PieceCatalogue catalogue, const GameConfig& config)
    : board_{kBoardRows, kBoardCols}
    , catalogue_{std::move(catalogue)}
    , scoreManager_{}
    , activePiece_{}
    , gravityIntervalMs_{config.gravityIntervalMs}
{
}

GameStatus GameState::status() const noexcept {
    if (gameOver_) return GameStatus::GameOver;
    if (paused_) return GameStatus::Paused;
    return GameStatus::Running;
}

Position GameState::spawnPosition() const noexcept {
    return Position{board_.cols() / 2 - 1, 0};
}

void GameState::start() {
    if (gameOver_ || activePiece_) return;
    spawnNewPiece();
}

void GameState::reset() {
    scoreManager_.reset();
    board_ = Board(board_.rows(), board_.cols());
    activePiece_.reset();
    position_ = Position{};
    gameOver_ = false;
    paused_ = false;
    lockedPieces_ = 0;
}

bool GameState::tick() {
    if (!acceptsCommands()) {
        return false;
    }

    if (tryMove(0, 1)) {
        return true;
    }

    // Cannot move down => lock piece and spawn a new one
    lockActivePieceAndProcessLines();
    spawnNewPiece();
    return false;
}

void GameState::moveHorizontal(int direction) {
    if (!acceptsCommands()) return;
    if (direction != -1 && direction != 1) return;
    tryMove(direction, 0);
}

void GameState::rotate() {
    if (!acceptsCommands()) return;

    Shape rotated = activePiece_->rotatedShape();
    if (!board_.collides(rotated, position_)) {
        activePiece_->setShape(std::move(rotated));
    }
    // No wall kicks: a blocked rotation simply keeps the old shape
}

void GameState::togglePause() {
    if (gameOver_) return;
    paused_ = !paused_;
}

GameState::RenderGrid GameState::renderableBoard() const {
    RenderGrid grid(static_cast<std::size_t>(board_.rows()),
                    std::vector<Cell>(static_cast<std::size_t>(board_.cols())));

    for (int r = 0; r < board_.rows(); ++r) {
        for (int c = 0; c < board_.cols(); ++c) {
            grid[r][c] = board_.cell(r, c);
        }
    }

    if (activePiece_) {
        for (const auto& b : activePiece_->shape().blocks()) {
            const int x = position_.x + b.x;
            const int y = position_.y + b.y;
            if (y >= 0 && y < board_.rows() && x >= 0 && x < board_.cols()) {
                grid[y][x] = activePiece_->color();
            }
        }
    }

    return grid;
}

bool GameState::spawnNewPiece() {
    Piece next = catalogue_.randomPiece();
    const Position spawn = spawnPosition();

    if (board_.collides(next.shape(), spawn)) {
        // Cannot spawn -> game over, locked board stays as the final state
        activePiece_.reset();
        gameOver_ = true;
        return false;
    }

    activePiece_ = std::move(next);
    position_ = spawn;
    return true;
}

void GameState::lockActivePieceAndProcessLines() {
    if (!activePiece_) return;

    board_.lockShape(activePiece_->shape(), position_, activePiece_->color());
    activePiece_.reset();
    ++lockedPieces_;

    const int lines = board_.clearFullLines();
    scoreManager_.addLinesCleared(lines);
}

bool GameState::tryMove(int dx, int dy) {
    if (!activePiece_) return false;

    const Position candidate{position_.x + dx, position_.y + dy};
    if (board_.collides(activePiece_->shape(), candidate)) {
        return false;
    }
    position_ = candidate;
    return true;
}

} // namespace blockdrop::core
