#pragma once

#include "app/AppConfig.hpp"
#include "app/GameSession.hpp"
#include "controller/Clock.hpp"
#include "gui_sdl/MouseGestureSource.hpp"
#include "gui_sdl/Screen.hpp"

namespace handtris::gui_sdl {

class PlayScreen final : public Screen {
public:
    PlayScreen(const app::AppConfig& config, SDL_Window* window);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;
    void onSuspend(Application& app) override;

private:
    struct Layout {
        int cell = 28;

        int boardX = 40;
        int boardY = 40;
        int boardW = 0;
        int boardH = 0;

        int sideX = 0;
        int sideW = 260;
    };

private:
    // Rendering helpers
    void renderZones(SDL_Renderer* renderer, int windowW, int windowH) const;
    void renderBoard(SDL_Renderer* renderer, const Layout& L) const;
    void renderPointer(SDL_Renderer* renderer, int windowW, int windowH) const;
    void renderBoardOverlayText(const Layout& L) const;
    void renderNextPieceWindow(int x, int y, int w, int h) const;
    int renderHUD(Application& app, int x, int y, int w);
    void renderControls(int x, int y, int w, int h) const;

    Layout computeLayout(int windowW, int windowH) const;

private:
    controller::SteadyClock m_clock;
    app::GameSession m_session;
    MouseGestureSource m_mouse;
};

} // namespace handtris::gui_sdl
