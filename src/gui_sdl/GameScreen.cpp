#include "gui_sdl/GameScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdint>

#include <imgui.h>
#include <SDL.h>

#include "controller/InputAction.hpp"
#include "core/Types.hpp"

namespace blockdrop::gui_sdl {

static ImU32 colorFor(blockdrop::core::Color color)
{
    using blockdrop::core::Color;
    switch (color) {
        case Color::Cyan:   return IM_COL32(  0, 255, 255, 255);
        case Color::Blue:   return IM_COL32(  0,   0, 255, 255);
        case Color::Orange: return IM_COL32(255, 165,   0, 255);
        case Color::Yellow: return IM_COL32(255, 255,   0, 255);
        case Color::Green:  return IM_COL32(  0, 255,   0, 255);
        case Color::Purple: return IM_COL32(160,  32, 240, 255);
        case Color::Red:    return IM_COL32(255,   0,   0, 255);
    }
    return IM_COL32(200, 200, 200, 255);
}

static void unpackImU32(ImU32 col, std::uint8_t& r, std::uint8_t& g, std::uint8_t& b, std::uint8_t& a)
{
    r = (col >> IM_COL32_R_SHIFT) & 0xFF;
    g = (col >> IM_COL32_G_SHIFT) & 0xFF;
    b = (col >> IM_COL32_B_SHIFT) & 0xFF;
    a = (col >> IM_COL32_A_SHIFT) & 0xFF;
}

GameScreen::GameScreen(const blockdrop::core::GameConfig& config)
    : gameState_(config)
    , controller_(gameState_)
{
    gameState_.start();
    controller_.resetTiming();
}

void GameScreen::dispatchAction(blockdrop::controller::InputAction action)
{
    controller_.handleAction(action);
}

GameScreen::Layout GameScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int rows = gameState_.board().rows();
    const int cols = gameState_.board().cols();

    const int margin = 20;

    const int usableW = windowW - (margin * 3) - L.panelW;
    const int usableH = windowH - (margin * 2);

    int cell = std::min(usableW / cols, usableH / rows);
    cell = std::clamp(cell, 12, 44);

    L.cell = cell;
    L.boardW = cols * cell;
    L.boardH = rows * cell;

    const int groupW = L.boardW + margin + L.panelW;
    L.boardX = std::max(margin, (windowW - groupW) / 2);
    L.boardY = margin + std::max(0, (usableH - L.boardH) / 2);
    L.panelX = L.boardX + L.boardW + margin;

    return L;
}

void GameScreen::handleEvent(const SDL_Event& e)
{
    using blockdrop::controller::InputAction;

    // Losing focus pauses a running game; the player resumes explicitly
    if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
        if (gameState_.status() == blockdrop::core::GameStatus::Running) {
            dispatchAction(InputAction::PauseResume);
        }
        return;
    }

    if (e.type != SDL_KEYDOWN) return;

    // Key repeat keeps moving the piece while a direction is held
    switch (e.key.keysym.sym) {
        case SDLK_LEFT:
            dispatchAction(InputAction::MoveLeft);
            break;
        case SDLK_RIGHT:
            dispatchAction(InputAction::MoveRight);
            break;
        case SDLK_DOWN:
            dispatchAction(InputAction::MoveDown);
            break;
        case SDLK_UP:
            if (e.key.repeat == 0) dispatchAction(InputAction::Rotate);
            break;
        case SDLK_p:
            if (e.key.repeat == 0) dispatchAction(InputAction::PauseResume);
            break;
        default:
            break;
    }
}

void GameScreen::update(blockdrop::controller::GameController::Duration elapsed)
{
    controller_.update(elapsed);
}

void GameScreen::render(SDL_Renderer* renderer, int windowW, int windowH)
{
    const Layout L = computeLayout(windowW, windowH);

    renderBoard(renderer, L);
    renderBoardOverlay(L);
    renderHUD(L);
}

void GameScreen::renderBoard(SDL_Renderer* renderer, const Layout& L) const
{
    const auto cells = gameState_.renderableBoard();
    const int rows = static_cast<int>(cells.size());
    const int cols = rows > 0 ? static_cast<int>(cells.front().size()) : 0;
    const int x = L.boardX;
    const int y = L.boardY;
    const int cellSize = L.cell;

    SDL_SetRenderDrawColor(renderer, 12, 12, 16, 255);
    SDL_Rect boardRect{x, y, cols * cellSize, rows * cellSize};
    SDL_RenderFillRect(renderer, &boardRect);

    SDL_SetRenderDrawColor(renderer, 40, 40, 55, 255);
    for (int r = 0; r <= rows; ++r) {
        SDL_RenderDrawLine(renderer, x, y + r * cellSize, x + cols * cellSize, y + r * cellSize);
    }
    for (int c = 0; c <= cols; ++c) {
        SDL_RenderDrawLine(renderer, x + c * cellSize, y, x + c * cellSize, y + rows * cellSize);
    }

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const auto& cell = cells[r][c];
            if (!cell) continue;

            std::uint8_t rr, gg, bb, aa;
            unpackImU32(colorFor(*cell), rr, gg, bb, aa);
            SDL_SetRenderDrawColor(renderer, rr, gg, bb, aa);

            SDL_Rect rect{x + c * cellSize + 1, y + r * cellSize + 1, cellSize - 2, cellSize - 2};
            SDL_RenderFillRect(renderer, &rect);
        }
    }

    if (gameState_.isPaused() || gameState_.isGameOver()) {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 190);
        SDL_RenderFillRect(renderer, &boardRect);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void GameScreen::renderBoardOverlay(const Layout& L)
{
    const bool over = gameState_.isGameOver();
    if (!over && !gameState_.isPaused()) return;

    const char* msg = over ? "Game Over!" : "Paused";
    const char* buttonLabel = over ? "Play Again" : "Resume";

    const float cx = L.boardX + L.boardW * 0.5f;
    const float cy = L.boardY + L.boardH * 0.5f;
    const float cardW = std::min(260.0f, L.boardW * 0.9f);

    ImGui::SetNextWindowPos(ImVec2(cx, cy), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(cardW, 0.0f), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.75f);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_AlwaysAutoResize;

    ImGui::Begin("##overlay", nullptr, flags);

    // Title drawn with the default font at double size
    ImFont* font = ImGui::GetFont();
    const float bigSize = ImGui::GetFontSize() * 2.0f;
    const ImVec2 tSize = font->CalcTextSizeA(bigSize, FLT_MAX, 0.0f, msg);
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const float availW = ImGui::GetContentRegionAvail().x;
    ImGui::GetWindowDrawList()->AddText(
        font, bigSize,
        ImVec2(origin.x + (availW - tSize.x) * 0.5f, origin.y),
        IM_COL32(255, 255, 255, 255),
        msg);
    ImGui::Dummy(ImVec2(availW, tSize.y + 8.0f));

    if (ImGui::Button(buttonLabel, ImVec2(-1, 0))) {
        if (over) {
            dispatchAction(blockdrop::controller::InputAction::Restart);
        } else {
            dispatchAction(blockdrop::controller::InputAction::PauseResume);
        }
    }

    ImGui::End();
}

void GameScreen::renderHUD(const Layout& L)
{
    ImGui::SetNextWindowPos(ImVec2((float)L.panelX, (float)L.boardY), ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2((float)L.panelW, 0.0f), ImVec2((float)L.panelW, 400.0f));
    ImGui::Begin("Game", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %llu", (unsigned long long)gameState_.score());
    ImGui::Text("Lines: %llu", (unsigned long long)gameState_.linesCleared());

    ImGui::Separator();

    switch (gameState_.status()) {
        case blockdrop::core::GameStatus::Running:
            ImGui::Text("Status: Running");
            break;
        case blockdrop::core::GameStatus::Paused:
            ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Status: Paused");
            break;
        case blockdrop::core::GameStatus::GameOver:
            ImGui::TextColored(ImVec4(1.0f, 0.25f, 0.25f, 1.0f), "Status: Game Over");
            break;
    }

    ImGui::Separator();

    if (ImGui::Button("Quit", ImVec2(-1, 0))) {
        quitRequested_ = true;
    }

    ImGui::Separator();
    ImGui::TextUnformatted("Controls");
    ImGui::TextUnformatted("Left/Right: Move");
    ImGui::TextUnformatted("Down: Move down");
    ImGui::TextUnformatted("Up: Rotate");
    ImGui::TextUnformatted("P: Pause/Resume");

    ImGui::Separator();
    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);

    ImGui::End();
}

} // namespace blockdrop::gui_sdl
