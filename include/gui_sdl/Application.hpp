#pragma once

#include <memory>

#include <SDL.h>

#include "app/AppConfig.hpp"
#include "gui_sdl/Screen.hpp"

namespace handtris::gui_sdl {

class Application {
public:
    explicit Application(app::AppConfig config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool init(const char* title);
    int run();

    void requestQuit() { m_running = false; }

    // Screen management
    void setScreen(std::unique_ptr<Screen> screen);

    // SDL accessors
    SDL_Window* window() const { return m_window; }
    SDL_Renderer* renderer() const { return m_renderer; }

    const app::AppConfig& config() const { return m_config; }

    // Simple utility: window size
    void getWindowSize(int& w, int& h) const;

private:
    void loadFonts();
    void suspendScreen();
    void shutdown();
    void beginImGuiFrame();
    void endImGuiFrame();

private:
    app::AppConfig m_config;
    bool m_running{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;
};

} // namespace handtris::gui_sdl
