#pragma once

#include <SDL.h>

namespace handtris::gui_sdl {

class Application;

// Base interface for screens
class Screen {
public:
    virtual ~Screen() = default;

    // Handle SDL events (keyboard/mouse/window)
    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Update simulation/UI state
    virtual void update(Application& app, float dtSeconds) = 0;

    // Render ImGui + any SDL rendering
    virtual void render(Application& app) = 0;

    // The window was minimized or is about to close; persist what needs persisting.
    virtual void onSuspend(Application&) {}
};

} // namespace handtris::gui_sdl
