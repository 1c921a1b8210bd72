#pragma once

#include <SDL.h>

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "controller/GameController.hpp"

namespace blockdrop::gui_sdl {

// Single-player view: owns the engine and its controller, turns SDL key
// events into InputActions and draws the renderable board with an ImGui HUD.
class GameScreen {
public:
    explicit GameScreen(const blockdrop::core::GameConfig& config = blockdrop::core::GameConfig{});

    void handleEvent(const SDL_Event& e);
    void update(blockdrop::controller::GameController::Duration elapsed);
    void render(SDL_Renderer* renderer, int windowW, int windowH);

    // Set once the player presses Quit in the HUD
    bool quitRequested() const { return quitRequested_; }

private:
    struct Layout {
        int cell = 28;

        int boardX = 40;
        int boardY = 40;
        int boardW = 0;
        int boardH = 0;

        int panelX = 0;
        int panelW = 240;
    };

    void renderBoard(SDL_Renderer* renderer, const Layout& L) const;
    void renderBoardOverlay(const Layout& L);
    void renderHUD(const Layout& L);

    void dispatchAction(blockdrop::controller::InputAction action);

    Layout computeLayout(int windowW, int windowH) const;

    blockdrop::core::GameState gameState_;
    blockdrop::controller::GameController controller_;
    bool quitRequested_{false};
};

} // namespace blockdrop::gui_sdl
