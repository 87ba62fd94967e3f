#include "gui_sdl/Application.hpp"

#include <cstdio>
#include <chrono>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace handtris::gui_sdl {

namespace {

// Candidates for the large overlay font, first readable one wins
const char* const kOverlayFonts[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/System/Library/Fonts/Supplemental/Arial.ttf",
    "C:\\Windows\\Fonts\\segoeui.ttf",
};

bool fileReadable(const char* path)
{
    SDL_RWops* rw = SDL_RWFromFile(path, "rb");
    if (!rw) {
        return false;
    }
    SDL_RWclose(rw);
    return true;
}

} // namespace

Application::Application(app::AppConfig config)
    : m_config(std::move(config))
{
}

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    m_window = SDL_CreateWindow(
        title,
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        m_config.windowWidth, m_config.windowHeight,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );

    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    m_renderer = SDL_CreateRenderer(
        m_window,
        -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC
    );

    if (!m_renderer) {
        std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }

    // ---- ImGui setup ----
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    loadFonts();

    // Initialize backends: SDL2 + SDL_Renderer
    ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer2_Init(m_renderer);

    m_running = true;
    return true;
}

void Application::loadFonts() {
    ImGuiIO& io = ImGui::GetIO();
    io.Fonts->AddFontDefault(); // keep default

    for (const char* path : kOverlayFonts) {
        if (fileReadable(path)) {
            io.Fonts->AddFontFromFileTTF(path, 32.0f);
            return;
        }
    }
    // Overlays fall back to the default font
    std::fprintf(stderr, "[gui] no overlay font found, using the default font\n");
}

void Application::shutdown() {
    // If SDL wasn't initialized, skip.
    if (!SDL_WasInit(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS)) {
        return;
    }

    // Screens hold game state that may still need saving
    m_screen.reset();

    if (ImGui::GetCurrentContext()) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
    }

    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    SDL_Quit();
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    m_screen = std::move(screen);
}

void Application::getWindowSize(int& w, int& h) const {
    w = 0; h = 0;
    if (m_window) SDL_GetWindowSize(m_window, &w, &h);
}

void Application::suspendScreen() {
    if (m_screen) {
        m_screen->onSuspend(*this);
    }
}

void Application::beginImGuiFrame() {
    // Clear screen FIRST so Screen can draw SDL stuff and ImGui can overlay on top
    SDL_SetRenderDrawColor(m_renderer, 20, 20, 20, 255);
    SDL_RenderClear(m_renderer);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void Application::endImGuiFrame() {
    ImGui::Render();

    // Render ImGui draw data
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);

    SDL_RenderPresent(m_renderer);
}

int Application::run() {
    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    SDL_Event e;
    while (m_running) {
        while (SDL_PollEvent(&e)) {
            // feed events to ImGui
            ImGui_ImplSDL2_ProcessEvent(&e);

            if (e.type == SDL_QUIT) {
                m_running = false;
            }

            if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_MINIMIZED) {
                suspendScreen();
            }

            if (m_screen) {
                m_screen->handleEvent(*this, e);
            }
        }

        if (!m_running) {
            break;
        }

        auto now = clock::now();
        float dt = std::chrono::duration<float>(now - last).count();
        last = now;

        if (m_screen) {
            m_screen->update(*this, dt);
        }

        beginImGuiFrame();

        if (m_screen) {
            m_screen->render(*this);
        }

        endImGuiFrame();
    }

    suspendScreen();
    return 0;
}

} // namespace handtris::gui_sdl
