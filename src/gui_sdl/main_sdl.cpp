#include "gui_sdl/Application.hpp"

#include "core/GameConfig.hpp"

int main(int, char**) {
    blockdrop::gui_sdl::Application app{blockdrop::core::GameConfig{}};
    if (!app.init("BlockDrop (SDL2 + ImGui)", 720, 700)) {
        return 1;
    }
    return app.run();
}
