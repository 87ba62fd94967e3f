#pragma once

#include <SDL.h>

#include "controller/GestureEvent.hpp"

namespace handtris::gui_sdl {

/// Stand-in for the hand tracker, driven by the mouse:
///   cursor x over the window      -> pointer position
///   left button held              -> index finger pointing
///   right click                   -> fist
///   middle click or Space         -> two fingers
class MouseGestureSource final : public controller::IGestureSource {
public:
    explicit MouseGestureSource(SDL_Window* window);

    void setGestureHandler(GestureHandler handler) override;

    // Samples the cursor and emits one PointerMoved
    void poll() override;

    // Feed SDL events; button presses become trigger gestures
    void handleEvent(const SDL_Event& e);

    bool isPointing() const { return m_pointing; }

private:
    void emit(const controller::GestureEvent& event);

    SDL_Window* m_window{nullptr};
    GestureHandler m_handler;
    bool m_pointing{false};
};

} // namespace handtris::gui_sdl
