#pragma once

#include <memory>

#include <SDL.h>

#include "core/GameConfig.hpp"
#include "controller/FrameTimer.hpp"
#include "gui_sdl/GameScreen.hpp"

namespace blockdrop::gui_sdl {

// Owns the SDL window/renderer, the ImGui context and the one game screen.
// run() is the owner thread: events, gravity and drawing all happen on it.
class Application {
public:
    explicit Application(const blockdrop::core::GameConfig& config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool init(const char* title, int width, int height);

    // Returns the process exit code
    int run();

private:
    bool createWindow(const char* title, int width, int height);
    void initImGui();
    void pollEvents();
    void drawFrame();
    void shutdown();

    blockdrop::core::GameConfig config_;

    bool running_{false};
    bool imguiReady_{false};

    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};

    std::unique_ptr<GameScreen> screen_;
    blockdrop::controller::FrameTimer frameTimer_;
};

} // namespace blockdrop::gui_sdl
