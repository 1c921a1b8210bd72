#pragma once

#include "Board.hpp"
#include "Piece.hpp"
#include "PieceCatalogue.hpp"
#include "ScoreManager.hpp"
#include "GameConfig.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace blockdrop::core {

enum class GameStatus {
    Running,
    Paused,
    GameOver
};

class GameState {
public:
    using RenderGrid = std::vector<std::vector<Cell>>;

    explicit GameState(const GameConfig& config = GameConfig{});
    explicit GameState(PieceCatalogue catalogue, const GameConfig& config = GameConfig{});

    const Board& board() const noexcept { return board_; }
    const std::optional<Piece>& activePiece() const noexcept { return activePiece_; }
    Position position() const noexcept { return position_; }

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    std::uint64_t linesCleared() const noexcept { return scoreManager_.linesCleared(); }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }

    bool isGameOver() const noexcept { return gameOver_; }
    bool isPaused() const noexcept { return paused_; }
    GameStatus status() const noexcept;

    int gravityIntervalMs() const noexcept { return gravityIntervalMs_; }

    // Top-center spawn offset: x = cols / 2 - 1, y = 0
    Position spawnPosition() const noexcept;

    // Spawn the first piece if none is active and the game is not over.
    void start();

    // Back to an empty board with no piece, score 0, not paused, not over.
    void reset();

    // One gravity step. Moves the piece down, or locks it, clears full rows,
    // scores them and spawns the next piece.
    // Returns true if the piece moved down.
    bool tick();

    // Player actions
    void moveHorizontal(int direction); // -1 = left, +1 = right
    void moveLeft() { moveHorizontal(-1); }
    void moveRight() { moveHorizontal(1); }
    void rotate();
    void togglePause();

    // Locked cells with the active piece drawn on top (rows >= 0 only)
    RenderGrid renderableBoard() const;

private:
    Board board_;
    PieceCatalogue catalogue_;
    ScoreManager scoreManager_;

    std::optional<Piece> activePiece_;
    Position position_{};

    bool gameOver_{false};
    bool paused_{false};
    std::uint64_t lockedPieces_{0};

    int gravityIntervalMs_;

    bool acceptsCommands() const noexcept {
        return activePiece_.has_value() && !gameOver_ && !paused_;
    }

    bool spawnNewPiece();
    void lockActivePieceAndProcessLines();
    bool tryMove(int dx, int dy);
};

} // namespace blockdrop::core
