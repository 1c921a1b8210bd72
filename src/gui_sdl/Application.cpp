#include "gui_sdl/Application.hpp"

#include <cstdio>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace blockdrop::gui_sdl {

namespace {

constexpr Uint32 kSdlSubsystems = SDL_INIT_VIDEO | SDL_INIT_EVENTS;

} // namespace

Application::Application(const blockdrop::core::GameConfig& config)
    : config_{config}
{
}

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title, int width, int height) {
    if (SDL_Init(kSdlSubsystems) != 0) {
        std::fprintf(stderr, "[sdl] SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    if (!createWindow(title, width, height)) {
        return false;
    }

    initImGui();

    screen_ = std::make_unique<GameScreen>(config_);
    running_ = true;
    return true;
}

bool Application::createWindow(const char* title, int width, int height) {
    window_ = SDL_CreateWindow(title,
                               SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               width, height,
                               SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window_) {
        std::fprintf(stderr, "[sdl] cannot create window: %s\n", SDL_GetError());
        return false;
    }

    // The board is redrawn every frame; vsync keeps that at the display rate
    renderer_ = SDL_CreateRenderer(window_, -1,
                                   SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer_) {
        std::fprintf(stderr, "[sdl] cannot create renderer: %s\n", SDL_GetError());
        return false;
    }
    return true;
}

void Application::initImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr; // fixed layout, nothing to remember

    ImGui_ImplSDL2_InitForSDLRenderer(window_, renderer_);
    ImGui_ImplSDLRenderer2_Init(renderer_);
    imguiReady_ = true;
}

void Application::shutdown() {
    // The screen owns the GameState the controller points into; drop it first
    screen_.reset();

    if (imguiReady_) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        imguiReady_ = false;
    }

    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    if (SDL_WasInit(kSdlSubsystems)) {
        SDL_Quit();
    }
}

void Application::pollEvents() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);

        if (e.type == SDL_QUIT) {
            running_ = false;
            continue;
        }

        // Keys typed into an ImGui widget are not game input
        if (e.type == SDL_KEYDOWN && ImGui::GetIO().WantCaptureKeyboard) {
            continue;
        }

        screen_->handleEvent(e);
    }
}

void Application::drawFrame() {
    SDL_SetRenderDrawColor(renderer_, 20, 20, 20, 255);
    SDL_RenderClear(renderer_);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    int w = 0, h = 0;
    SDL_GetWindowSize(window_, &w, &h);
    screen_->render(renderer_, w, h);

    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer_);
    SDL_RenderPresent(renderer_);
}

int Application::run() {
    if (!running_ || !screen_) {
        std::fprintf(stderr, "[sdl] run() called before a successful init()\n");
        return 1;
    }

    frameTimer_.restart();

    while (running_) {
        pollEvents();
        if (!running_) break;

        screen_->update(frameTimer_.advance());
        drawFrame();

        if (screen_->quitRequested()) {
            running_ = false;
        }
    }

    return 0;
}

} // namespace blockdrop::gui_sdl
