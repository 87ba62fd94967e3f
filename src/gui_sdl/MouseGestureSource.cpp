#include "gui_sdl/MouseGestureSource.hpp"

#include <algorithm>
#include <utility>

namespace handtris::gui_sdl {

using controller::GestureEvent;

MouseGestureSource::MouseGestureSource(SDL_Window* window)
    : m_window(window)
{
}

void MouseGestureSource::setGestureHandler(GestureHandler handler)
{
    m_handler = std::move(handler);
}

void MouseGestureSource::poll()
{
    if (!m_window) {
        return;
    }

    int w = 0, h = 0;
    SDL_GetWindowSize(m_window, &w, &h);
    if (w <= 0) {
        return;
    }

    int mx = 0, my = 0;
    const Uint32 buttons = SDL_GetMouseState(&mx, &my);
    m_pointing = (buttons & SDL_BUTTON(SDL_BUTTON_LEFT)) != 0;

    const float x = std::clamp(static_cast<float>(mx) / static_cast<float>(w), 0.0f, 1.0f);
    emit(GestureEvent::pointer(x, m_pointing));
}

void MouseGestureSource::handleEvent(const SDL_Event& e)
{
    if (e.type == SDL_MOUSEBUTTONDOWN) {
        if (e.button.button == SDL_BUTTON_RIGHT) {
            emit(GestureEvent::fist());
        } else if (e.button.button == SDL_BUTTON_MIDDLE) {
            emit(GestureEvent::twoFinger());
        }
    } else if (e.type == SDL_KEYDOWN && e.key.repeat == 0 && e.key.keysym.sym == SDLK_SPACE) {
        emit(GestureEvent::twoFinger());
    }
}

void MouseGestureSource::emit(const GestureEvent& event)
{
    if (m_handler) {
        m_handler(event);
    }
}

} // namespace handtris::gui_sdl
