#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "controller/FrameTimer.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"

using namespace blockdrop::core;
using blockdrop::controller::FrameTimer;
using blockdrop::controller::GameController;
using blockdrop::controller::InputAction;

namespace {

char colorLetter(Color color) {
    switch (color) {
    case Color::Cyan:   return 'I';
    case Color::Blue:   return 'J';
    case Color::Orange: return 'L';
    case Color::Yellow: return 'O';
    case Color::Green:  return 'S';
    case Color::Purple: return 'T';
    case Color::Red:    return 'Z';
    }
    return '#';
}

const char* statusName(GameStatus status) {
    switch (status) {
    case GameStatus::Running:  return "Running";
    case GameStatus::Paused:   return "Paused";
    case GameStatus::GameOver: return "GameOver";
    }
    return "?";
}

// Everything the screen shows; used to redraw only when it changes
struct Frame {
    GameState::RenderGrid cells;
    std::uint64_t score{0};
    std::uint64_t lines{0};
    GameStatus status{GameStatus::Running};

    bool operator==(const Frame& o) const {
        return cells == o.cells && score == o.score && lines == o.lines && status == o.status;
    }
};

Frame capture(const GameState& game) {
    return Frame{game.renderableBoard(), game.score(), game.linesCleared(), game.status()};
}

// Render the board with the active piece overlaid as ASCII
void printFrame(const Frame& frame) {
    const int cols = frame.cells.empty() ? 0 : static_cast<int>(frame.cells.front().size());

    std::cout << "\n==== BLOCKDROP ====\n";
    std::cout << "Score: " << frame.score
              << " | Lines: " << frame.lines
              << " | Status: " << statusName(frame.status) << '\n';

    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (const auto& row : frame.cells) {
        std::cout << '|';
        for (const Cell& cell : row) {
            std::cout << (cell ? colorLetter(*cell) : '.');
        }
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    if (frame.status == GameStatus::GameOver) {
        std::cout << "Game Over! Press 'r' to play again or 'q' to quit.\n";
    } else if (frame.status == GameStatus::Paused) {
        std::cout << "Paused. Press 'p' to resume.\n";
    }

    std::cout << "Commands: a = left, d = right, s = down, w = rotate, "
                 "p = pause, r = restart, q = quit (then Enter)\n";
}

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--seed <n>] [--interval <ms>]\n"
              << "  --seed <n>       reproducible piece order\n"
              << "  --interval <ms>  gravity interval in milliseconds (default 1000)\n";
}

// Returns false on malformed arguments
bool parseArgs(int argc, char** argv, GameConfig& config, bool& helpRequested) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            helpRequested = true;
            return true;
        }
        if ((arg == "--seed" || arg == "--interval") && i + 1 < argc) {
            const std::string value = argv[++i];
            try {
                if (arg == "--seed") {
                    config.seed = static_cast<std::uint32_t>(std::stoul(value));
                } else {
                    config.gravityIntervalMs = std::stoi(value);
                }
            } catch (const std::exception& e) {
                std::cerr << "[console] invalid value '" << value << "' for " << arg
                          << ": " << e.what() << '\n';
                return false;
            }
            continue;
        }
        std::cerr << "[console] unknown or incomplete option: " << arg << '\n';
        return false;
    }
    return true;
}

bool mapKeyToAction(char c, InputAction& action) {
    switch (c) {
    case 'a': case 'A': action = InputAction::MoveLeft;    return true;
    case 'd': case 'D': action = InputAction::MoveRight;   return true;
    case 's': case 'S': action = InputAction::MoveDown;    return true;
    case 'w': case 'W': action = InputAction::Rotate;      return true;
    case 'p': case 'P': action = InputAction::PauseResume; return true;
    case 'r': case 'R': action = InputAction::Restart;     return true;
    default: return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    GameConfig config;
    bool helpRequested = false;
    if (!parseArgs(argc, argv, config, helpRequested)) {
        printUsage(argv[0]);
        return 1;
    }
    if (helpRequested) {
        printUsage(argv[0]);
        return 0;
    }

    GameState game{config};
    GameController controller{game};

    std::atomic<bool> quit{false};

    // Input producer: one line per command, posted to the controller queue.
    std::thread inputThread([&controller, &quit]() {
        std::string line;
        while (!quit && std::getline(std::cin, line)) {
            for (char c : line) {
                if (c == 'q' || c == 'Q') {
                    quit = true;
                    return;
                }
                InputAction action{};
                if (mapKeyToAction(c, action)) {
                    controller.post(action);
                } else if (c != ' ') {
                    std::cerr << "[console] unknown command: " << c << '\n';
                }
            }
        }
        quit = true; // EOF
    });

    // Gravity producer + single consumer: the main loop owns the GameState.
    constexpr auto kFrameStep = std::chrono::milliseconds{50};

    FrameTimer timer;
    controller.update(GameController::Duration{0});
    Frame shown = capture(game);
    printFrame(shown);

    while (!quit) {
        std::this_thread::sleep_for(kFrameStep);

        controller.update(timer.advance());

        Frame current = capture(game);
        if (!(current == shown)) {
            shown = std::move(current);
            printFrame(shown);
        }
    }

    inputThread.join();
    std::cout << "Quitting. Final score: " << game.score() << '\n';
    return 0;
}
