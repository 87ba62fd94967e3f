#include "gui_sdl/PlayScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <cstdint>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"

namespace handtris::gui_sdl {

using core::GameStatus;

static void unpackColor(core::Color c, std::uint8_t& r, std::uint8_t& g, std::uint8_t& b)
{
    r = (c >> 16) & 0xFF;
    g = (c >> 8) & 0xFF;
    b = c & 0xFF;
}

static ImU32 toImColor(core::Color c)
{
    std::uint8_t r, g, b;
    unpackColor(c, r, g, b);
    return IM_COL32(r, g, b, 255);
}

PlayScreen::PlayScreen(const app::AppConfig& config, SDL_Window* window)
    : m_session(config, m_clock)
    , m_mouse(window)
{
    m_session.gestures().connect(m_mouse);

    // A resumed game continues as it was saved; a fresh one waits for Start
    if (!m_session.resumeSavedSession()) {
        m_session.pause();
    }
}

PlayScreen::Layout PlayScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int rows = m_session.game().board().rows();
    const int cols = m_session.game().board().cols();

    const int margin = 20;

    const int usableW = windowW - (margin * 3) - L.sideW;
    const int usableH = windowH - (margin * 2);

    int cell = std::min(usableW / cols, usableH / rows);
    cell = std::clamp(cell, 12, 44);

    L.cell = cell;
    L.boardW = cols * cell;
    L.boardH = rows * cell;

    const int groupW = L.boardW + margin + L.sideW;
    L.boardX = std::max(margin, (windowW - groupW) / 2);
    L.boardY = margin + std::max(0, (usableH - L.boardH) / 2);
    L.sideX = L.boardX + L.boardW + margin;

    return L;
}

void PlayScreen::handleEvent(Application& app, const SDL_Event& e)
{
    const ImGuiIO& io = ImGui::GetIO();

    if (!io.WantCaptureMouse &&
        (e.type == SDL_MOUSEBUTTONDOWN || e.type == SDL_MOUSEBUTTONUP)) {
        m_mouse.handleEvent(e);
        return;
    }

    if (e.type != SDL_KEYDOWN || e.key.repeat != 0) {
        return;
    }

    switch (e.key.keysym.sym) {
        case SDLK_SPACE:
            m_mouse.handleEvent(e);
            break;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            if (!m_session.game().isGameOver()) {
                m_session.start();
            }
            break;
        case SDLK_p:
            m_session.togglePause();
            break;
        case SDLK_r:
            m_session.restart();
            break;
        case SDLK_ESCAPE:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void PlayScreen::update(Application&, float dtSeconds)
{
    // Cursor over an ImGui window is not a pointing hand
    if (!ImGui::GetIO().WantCaptureMouse) {
        m_mouse.poll();
    }

    const int ms = static_cast<int>(dtSeconds * 1000.0f + 0.5f);
    m_session.frame(app::GameSession::Duration{ms});
}

void PlayScreen::onSuspend(Application&)
{
    m_session.suspend();
}

void PlayScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);

    const Layout L = computeLayout(winW, winH);
    SDL_Renderer* renderer = app.renderer();

    renderZones(renderer, winW, winH);
    renderBoard(renderer, L);
    renderPointer(renderer, winW, winH);
    renderBoardOverlayText(L);

    const int margin = 16;
    const int hudH = renderHUD(app, L.sideX, L.boardY, L.sideW);

    const int nextY = L.boardY + hudH + margin;
    const int nextH = std::clamp(L.cell * 6 + 40, 160, 260);
    renderNextPieceWindow(L.sideX, nextY, L.sideW, nextH);

    const int ctrlY = nextY + nextH + margin;
    renderControls(L.sideX, ctrlY, L.sideW, std::max(120, winH - ctrlY - margin));
}

void PlayScreen::renderZones(SDL_Renderer* renderer, int windowW, int windowH) const
{
    const auto& cfg = m_session.controller().config();
    const int left = static_cast<int>(cfg.leftZone * windowW);
    const int right = static_cast<int>(cfg.rightZone * windowW);

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    SDL_SetRenderDrawColor(renderer, 60, 90, 160, 40);
    SDL_Rect leftRect{0, 0, left, windowH};
    SDL_RenderFillRect(renderer, &leftRect);

    SDL_SetRenderDrawColor(renderer, 160, 90, 60, 40);
    SDL_Rect rightRect{right, 0, windowW - right, windowH};
    SDL_RenderFillRect(renderer, &rightRect);

    SDL_SetRenderDrawColor(renderer, 200, 200, 200, 90);
    SDL_RenderDrawLine(renderer, left, 0, left, windowH);
    SDL_RenderDrawLine(renderer, right, 0, right, windowH);

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
}

void PlayScreen::renderBoard(SDL_Renderer* renderer, const Layout& L) const
{
    const auto& game = m_session.game();
    const auto& board = game.board();
    const int rows = board.rows();
    const int cols = board.cols();
    const int x = L.boardX;
    const int y = L.boardY;
    const int cellSize = L.cell;

    SDL_SetRenderDrawColor(renderer, 12, 12, 16, 255);
    SDL_Rect boardRect{x, y, cols * cellSize, rows * cellSize};
    SDL_RenderFillRect(renderer, &boardRect);

    SDL_SetRenderDrawColor(renderer, 40, 40, 55, 255);
    for (int r = 0; r <= rows; ++r) {
        SDL_RenderDrawLine(renderer, x, y + r * cellSize, x + cols * cellSize, y + r * cellSize);
    }
    for (int c = 0; c <= cols; ++c) {
        SDL_RenderDrawLine(renderer, x + c * cellSize, y, x + c * cellSize, y + rows * cellSize);
    }

    std::uint8_t rr, gg, bb;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const core::Color color = board.cell(r, c);
            if (color == core::EmptyCell) continue;

            unpackColor(color, rr, gg, bb);
            SDL_SetRenderDrawColor(renderer, rr, gg, bb, 255);

            SDL_Rect cell{x + c * cellSize + 1, y + r * cellSize + 1, cellSize - 2, cellSize - 2};
            SDL_RenderFillRect(renderer, &cell);
        }
    }

    if (const auto& active = game.currentPiece()) {
        // Ghost
        if (const auto dropRow = game.dropRow()) {
            core::Tetromino ghost = *active;
            ghost.setPosition(active->x(), *dropRow);

            SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 70);
            for (const auto& b : ghost.blocks()) {
                if (b.row < 0) continue;
                SDL_Rect rct{x + b.col * cellSize + 2, y + b.row * cellSize + 2, cellSize - 4, cellSize - 4};
                SDL_RenderDrawRect(renderer, &rct);
            }
            SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
        }

        // Active
        unpackColor(core::mainColorFor(active->type()), rr, gg, bb);
        SDL_SetRenderDrawColor(renderer, rr, gg, bb, 255);

        for (const auto& b : active->blocks()) {
            if (b.row < 0) continue;
            SDL_Rect cell{x + b.col * cellSize + 1, y + b.row * cellSize + 1, cellSize - 2, cellSize - 2};
            SDL_RenderFillRect(renderer, &cell);
        }
    }

    if (game.status() != GameStatus::Running) {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 160);
        SDL_RenderFillRect(renderer, &boardRect);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void PlayScreen::renderPointer(SDL_Renderer* renderer, int windowW, int windowH) const
{
    const auto pointerX = m_session.controller().lastPointerX();
    if (!pointerX) return;

    const int px = static_cast<int>(*pointerX * windowW);
    if (m_mouse.isPointing()) {
        SDL_SetRenderDrawColor(renderer, 80, 230, 120, 255);
    } else {
        SDL_SetRenderDrawColor(renderer, 140, 140, 140, 255);
    }

    SDL_Rect marker{px - 6, windowH - 18, 12, 12};
    SDL_RenderFillRect(renderer, &marker);
    SDL_RenderDrawLine(renderer, px, 0, px, windowH - 18);
}

void PlayScreen::renderBoardOverlayText(const Layout& L) const
{
    const auto status = m_session.game().status();
    if (status == GameStatus::Running) return;

    const char* msg = (status == GameStatus::Paused) ? "PAUSED" : "GAME OVER";
    const char* hint = (status == GameStatus::Paused)
        ? "Press Enter or P to play"
        : "Press R to restart";

    ImDrawList* dl = ImGui::GetForegroundDrawList();

    const float cx = L.boardX + L.boardW * 0.5f;
    const float cy = L.boardY + L.boardH * 0.5f;

    // Scale card by cell size for responsiveness
    const float scale = std::clamp(L.cell / 28.0f, 0.75f, 1.25f);
    const float cardW = std::min(420.0f * scale, L.boardW * 0.90f);
    const float cardH = 120.0f * scale;

    ImVec2 p0(cx - cardW * 0.5f, cy - cardH * 0.5f);
    ImVec2 p1(cx + cardW * 0.5f, cy + cardH * 0.5f);
    dl->AddRectFilled(p0, p1, IM_COL32(0, 0, 0, 175), 10.0f);

    ImGuiIO& io = ImGui::GetIO();
    ImFont* bigFont = (io.Fonts->Fonts.Size > 1) ? io.Fonts->Fonts[1] : ImGui::GetFont();
    const float bigSize = bigFont->FontSize * scale;

    ImVec2 tSize = bigFont->CalcTextSizeA(bigSize, FLT_MAX, 0.0f, msg);
    dl->AddText(bigFont, bigSize,
                ImVec2(cx - tSize.x * 0.5f, cy - 44.0f * scale),
                IM_COL32(255, 255, 255, 255),
                msg);

    ImVec2 hSize = ImGui::CalcTextSize(hint);
    dl->AddText(ImVec2(cx - hSize.x * 0.5f, cy + 18.0f * scale),
                IM_COL32(220, 220, 220, 255),
                hint);
}

void PlayScreen::renderNextPieceWindow(int x, int y, int w, int h) const
{
    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2((float)w, (float)h), ImGuiCond_Always);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove;

    ImGui::Begin("Next Piece", nullptr, flags);

    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 wp = ImGui::GetWindowPos();

    const float pad = 25.0f;
    const float areaW = (float)w - pad * 2.0f;
    const float areaH = (float)h - pad * 2.0f;
    const float side = (std::min)(areaW, areaH);

    const ImVec2 a0(wp.x + pad + (areaW - side) * 0.5f, wp.y + pad);
    const ImVec2 a1(a0.x + side, a0.y + side);

    dl->AddRect(a0, a1, IM_COL32(120, 120, 120, 120), 6.0f);

    const auto& next = m_session.game().nextPiece();
    const auto blocks = next.blocks();
    const ImU32 col = toImColor(core::mainColorFor(next.type()));

    int minR = blocks[0].row, maxR = blocks[0].row;
    int minC = blocks[0].col, maxC = blocks[0].col;
    for (const auto& b : blocks) {
        minR = std::min(minR, b.row); maxR = std::max(maxR, b.row);
        minC = std::min(minC, b.col); maxC = std::max(maxC, b.col);
    }

    const float cell = side / 4.5f;
    const float pieceW = (maxC - minC + 1) * cell;
    const float pieceH = (maxR - minR + 1) * cell;
    const float ox = a0.x + (side - pieceW) * 0.5f - minC * cell;
    const float oy = a0.y + (side - pieceH) * 0.5f - minR * cell;

    for (const auto& b : blocks) {
        const float bx = ox + b.col * cell;
        const float by = oy + b.row * cell;
        dl->AddRectFilled(ImVec2(bx + 1, by + 1), ImVec2(bx + cell - 2, by + cell - 2), col);
        dl->AddRect(ImVec2(bx + 1, by + 1), ImVec2(bx + cell - 2, by + cell - 2), IM_COL32(20, 20, 20, 255));
    }

    ImGui::End();
}

int PlayScreen::renderHUD(Application& app, int x, int y, int w)
{
    const auto& game = m_session.game();

    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2((float)w, 0.0f), ImVec2((float)w, 320.0f));
    ImGui::Begin("Game", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %llu", (unsigned long long)game.score());
    ImGui::Text("High score: %llu", (unsigned long long)game.highScore());
    ImGui::Text("Locked pieces: %llu", (unsigned long long)game.lockedPieces());

    ImGui::Separator();

    switch (game.status()) {
        case GameStatus::Running:
            ImGui::Text("Status: Running");
            break;
        case GameStatus::Paused:
            ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Status: Paused");
            break;
        case GameStatus::GameOver:
            ImGui::TextColored(ImVec4(1.0f, 0.25f, 0.25f, 1.0f), "Status: Game Over");
            break;
    }

    ImGui::Separator();

    if (game.status() == GameStatus::Running) {
        if (ImGui::Button("Pause", ImVec2(-1, 0))) {
            m_session.pause();
        }
    } else if (game.status() == GameStatus::Paused) {
        if (ImGui::Button("Start", ImVec2(-1, 0))) {
            m_session.start();
        }
    }

    if (ImGui::Button("Restart", ImVec2(-1, 0))) {
        m_session.restart();
    }

    if (ImGui::Button("Quit", ImVec2(-1, 0))) {
        app.requestQuit();
    }

    const int height = static_cast<int>(ImGui::GetWindowSize().y);
    ImGui::End();
    return height;
}

void PlayScreen::renderControls(int x, int y, int w, int h) const
{
    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2((float)w, (float)h), ImGuiCond_Always);
    ImGui::SetNextWindowCollapsed(true, ImGuiCond_FirstUseEver);
    ImGui::Begin("Controls", nullptr, ImGuiWindowFlags_NoMove);

    ImGui::TextUnformatted("Hold left button: point");
    ImGui::TextUnformatted("  left band moves left,");
    ImGui::TextUnformatted("  right band moves right");
    ImGui::TextUnformatted("Right click: fist (rotate)");
    ImGui::TextUnformatted("Middle click / Space:");
    ImGui::TextUnformatted("  two fingers (hard drop)");
    ImGui::TextUnformatted("Enter: Start, P: Pause");
    ImGui::TextUnformatted("R: Restart, Esc: Quit");

    ImGui::Separator();
    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);

    ImGui::End();
}

} // namespace handtris::gui_sdl
