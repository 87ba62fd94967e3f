#include "app/AppConfig.hpp"
#include "gui_sdl/Application.hpp"
#include "gui_sdl/PlayScreen.hpp"

#include <cstdio>
#include <exception>
#include <memory>

int main(int argc, char** argv) {
    auto config = handtris::app::parseCommandLine(argc, argv);
    if (!config) {
        return 1;
    }

    try {
        handtris::gui_sdl::Application app{*config};
        if (!app.init("Handtris (SDL2 + ImGui)")) {
            return 1;
        }

        app.setScreen(std::make_unique<handtris::gui_sdl::PlayScreen>(app.config(), app.window()));
        return app.run();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[gui] fatal: %s\n", e.what());
        return 1;
    }
}
