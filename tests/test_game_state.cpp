#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <vector>

#include "core/GameState.hpp"
#include "core/PieceCatalogue.hpp"
#include "core/Types.hpp"

using namespace blockdrop::core;

namespace {

GameState scriptedGame(std::vector<PieceKind> kinds) {
    return GameState{PieceCatalogue{std::move(kinds)}};
}

bool renderIsEmpty(const GameState& game) {
    for (const auto& row : game.renderableBoard()) {
        for (const auto& cell : row) {
            if (cell) return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("GameState starts empty with no active piece", "[gamestate]") {
    GameState game = scriptedGame({PieceKind::O});

    REQUIRE(game.board().rows() == 20);
    REQUIRE(game.board().cols() == 10);
    REQUIRE_FALSE(game.activePiece().has_value());
    REQUIRE(game.score() == 0);
    REQUIRE_FALSE(game.isGameOver());
    REQUIRE_FALSE(game.isPaused());
    REQUIRE(game.status() == GameStatus::Running);
    REQUIRE(game.gravityIntervalMs() == 1000);
    REQUIRE(renderIsEmpty(game));

    // Commands without a piece change nothing
    REQUIRE_FALSE(game.tick());
    game.moveLeft();
    game.moveRight();
    game.rotate();
    REQUIRE_FALSE(game.activePiece().has_value());
    REQUIRE(game.position() == Position{0, 0});
    REQUIRE(renderIsEmpty(game));
}

TEST_CASE("GameState start spawns at the top center", "[gamestate]") {
    GameState game = scriptedGame({PieceKind::T, PieceKind::I});

    game.start();

    REQUIRE(game.activePiece().has_value());
    REQUIRE(game.activePiece()->kind() == PieceKind::T);
    REQUIRE(game.position() == Position{4, 0});
    REQUIRE(game.spawnPosition() == Position{4, 0});

    // A second start keeps the current piece
    game.start();
    REQUIRE(game.activePiece()->kind() == PieceKind::T);
}

TEST_CASE("GameState tick with free space moves down exactly one row", "[gamestate]") {
    GameState game = scriptedGame({PieceKind::S});
    game.start();

    const Shape shapeBefore = game.activePiece()->shape();
    const Position before = game.position();

    for (int step = 1; step <= 5; ++step) {
        REQUIRE(game.tick());
        REQUIRE(game.position() == Position{before.x, before.y + step});
        REQUIRE(game.activePiece()->shape() == shapeBefore);
        REQUIRE(game.score() == 0);
        REQUIRE(game.board().isEmpty());
    }
}

TEST_CASE("GameState O piece stops at the left wall", "[gamestate][movement]") {
    GameState game = scriptedGame({PieceKind::O});
    game.start();
    REQUIRE(game.position() == Position{4, 0});

    for (int expected = 3; expected >= 0; --expected) {
        game.moveHorizontal(-1);
        REQUIRE(game.position().x == expected);
    }

    game.moveHorizontal(-1);
    REQUIRE(game.position() == Position{0, 0});
}

TEST_CASE("GameState O piece stops at the right wall", "[gamestate][movement]") {
    GameState game = scriptedGame({PieceKind::O});
    game.start();

    for (int i = 0; i < 4; ++i) {
        game.moveRight();
    }
    REQUIRE(game.position().x == 8);

    game.moveRight();
    REQUIRE(game.position().x == 8);
}

TEST_CASE("GameState ignores directions other than -1 and +1", "[gamestate][movement]") {
    GameState game = scriptedGame({PieceKind::O});
    game.start();

    game.moveHorizontal(0);
    game.moveHorizontal(3);
    game.moveHorizontal(-2);
    REQUIRE(game.position() == Position{4, 0});
}

TEST_CASE("GameState movement is blocked by settled cells", "[gamestate][movement]") {
    GameState game = scriptedGame({PieceKind::O});
    game.start();

    // First O settles at the bottom, columns 4-5
    while (game.tick()) {}
    REQUIRE(game.board().isOccupied(19, 4));

    // Second O, two columns to the right, dropped to the same height
    game.moveRight();
    game.moveRight();
    while (game.position().y < 18) {
        REQUIRE(game.tick());
    }
    REQUIRE(game.position() == Position{6, 18});

    game.moveLeft();
    REQUIRE(game.position().x == 6);
}

TEST_CASE("GameState rotation turns the piece clockwise in place", "[gamestate][rotation]") {
    GameState game = scriptedGame({PieceKind::I});
    game.start();

    game.rotate();
    REQUIRE(game.activePiece()->shape() == Shape{{1}, {1}, {1}, {1}});
    REQUIRE(game.position() == Position{4, 0});

    game.rotate();
    REQUIRE(game.activePiece()->shape() == Shape{{1, 1, 1, 1}});
}

TEST_CASE("GameState four rotations restore every template", "[gamestate][rotation]") {
    const std::vector<PieceKind> kinds{
        PieceKind::I, PieceKind::J, PieceKind::L, PieceKind::O,
        PieceKind::S, PieceKind::T, PieceKind::Z};

    for (PieceKind kind : kinds) {
        GameState game = scriptedGame({kind});
        game.start();
        // Room above and below the spawn point
        for (int i = 0; i < 5; ++i) game.tick();

        const Shape original = game.activePiece()->shape();
        for (int i = 0; i < 4; ++i) game.rotate();

        INFO("piece " << pieceLetter(kind));
        REQUIRE(game.activePiece()->shape() == original);
    }
}

TEST_CASE("GameState rotation against a wall is rejected without a kick", "[gamestate][rotation]") {
    GameState game = scriptedGame({PieceKind::I});
    game.start();

    game.rotate(); // vertical
    for (int i = 0; i < 5; ++i) game.moveRight();
    REQUIRE(game.position().x == 9);

    const Shape vertical = game.activePiece()->shape();
    game.rotate(); // horizontal would need columns 9-12
    REQUIRE(game.activePiece()->shape() == vertical);
    REQUIRE(game.position().x == 9);
}

TEST_CASE("GameState pause blocks every command but toggle and reset", "[gamestate][pause]") {
    GameState game = scriptedGame({PieceKind::T});
    game.start();
    game.tick();

    const Position before = game.position();
    const Shape shapeBefore = game.activePiece()->shape();

    game.togglePause();
    REQUIRE(game.isPaused());
    REQUIRE(game.status() == GameStatus::Paused);

    REQUIRE_FALSE(game.tick());
    game.moveLeft();
    game.moveRight();
    game.rotate();
    REQUIRE(game.position() == before);
    REQUIRE(game.activePiece()->shape() == shapeBefore);

    game.togglePause();
    REQUIRE_FALSE(game.isPaused());
    REQUIRE(game.status() == GameStatus::Running);
    REQUIRE(game.tick());
    REQUIRE(game.position().y == before.y + 1);
}

TEST_CASE("GameState renderable board overlays the active piece without touching the board", "[gamestate][render]") {
    GameState game = scriptedGame({PieceKind::O});
    game.start();

    const auto grid = game.renderableBoard();
    REQUIRE(grid.size() == 20);
    REQUIRE(grid.front().size() == 10);

    int occupied = 0;
    for (int r = 0; r < 20; ++r) {
        for (int c = 0; c < 10; ++c) {
            if (grid[r][c]) {
                ++occupied;
                REQUIRE(*grid[r][c] == Color::Yellow);
                REQUIRE((r == 0 || r == 1));
                REQUIRE((c == 4 || c == 5));
            }
        }
    }
    REQUIRE(occupied == 4);
    REQUIRE(game.board().isEmpty());

    // Asking twice gives the same answer
    REQUIRE(game.renderableBoard() == grid);
}

TEST_CASE("GameState lock merges the piece and spawns the next one", "[gamestate]") {
    GameState game = scriptedGame({PieceKind::T, PieceKind::Z});
    game.start();

    int moves = 0;
    while (game.tick()) {
        ++moves;
    }
    REQUIRE(moves == 18); // 2-row T from row 0 to rows 18-19

    REQUIRE(game.lockedPieces() == 1);
    REQUIRE(game.board().cell(18, 5) == Color::Purple);
    REQUIRE(game.board().cell(19, 4) == Color::Purple);
    REQUIRE(game.board().cell(19, 5) == Color::Purple);
    REQUIRE(game.board().cell(19, 6) == Color::Purple);
    REQUIRE_FALSE(game.board().isOccupied(18, 4));

    REQUIRE(game.activePiece().has_value());
    REQUIRE(game.activePiece()->kind() == PieceKind::Z);
    REQUIRE(game.position() == Position{4, 0});
    REQUIRE(game.score() == 0);
}

TEST_CASE("GameState reset returns to a fresh state", "[gamestate][reset]") {
    GameState game = scriptedGame({PieceKind::I, PieceKind::O});
    game.start();
    while (game.tick()) {}
    game.togglePause();

    game.reset();

    REQUIRE(game.score() == 0);
    REQUIRE(game.linesCleared() == 0);
    REQUIRE(game.lockedPieces() == 0);
    REQUIRE_FALSE(game.isGameOver());
    REQUIRE_FALSE(game.isPaused());
    REQUIRE_FALSE(game.activePiece().has_value());
    REQUIRE(game.position() == Position{0, 0});
    REQUIRE(game.board().isEmpty());
    REQUIRE(renderIsEmpty(game));

    // The next spawn opportunity installs a piece again
    game.start();
    REQUIRE(game.activePiece().has_value());
    REQUIRE_FALSE(renderIsEmpty(game));
}
