#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "app/AppConfig.hpp"
#include "app/GameSession.hpp"
#include "controller/Clock.hpp"
#include "core/Board.hpp"
#include "core/GameState.hpp"
#include "core/Tetromino.hpp"

using namespace handtris::core;

namespace {

// Render the current board + ghost + current piece as ASCII
void printGame(const GameState& game) {
    const Board& board = game.board();
    const int rows = board.rows();
    const int cols = board.cols();

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (!board.isEmpty(r, c)) {
                lines[r][c] = '#'; // locked blocks
            }
        }
    }

    if (const auto& piece = game.currentPiece()) {
        if (auto dropRow = game.dropRow()) {
            Tetromino ghost = *piece;
            ghost.setPosition(piece->x(), *dropRow);
            for (const auto& b : ghost.blocks()) {
                if (b.row >= 0 && b.row < rows && b.col >= 0 && b.col < cols) {
                    lines[b.row][b.col] = ':';
                }
            }
        }
        for (const auto& b : piece->blocks()) {
            if (b.row >= 0 && b.row < rows && b.col >= 0 && b.col < cols) {
                lines[b.row][b.col] = pieceTypeName(piece->type());
            }
        }
    }

    std::cout << "\n==== HANDTRIS CONSOLE VIEW ====\n";
    std::cout << "Score: " << game.score()
              << " | High: " << game.highScore()
              << " | Next: " << pieceTypeName(game.nextPiece().type())
              << " | Status: ";

    switch (game.status()) {
    case GameStatus::Running:  std::cout << "Running";  break;
    case GameStatus::Paused:   std::cout << "Paused";   break;
    case GameStatus::GameOver: std::cout << "GameOver"; break;
    }
    std::cout << '\n';

    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (int r = 0; r < rows; ++r) {
        std::cout << '|' << lines[r] << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    std::cout << "Commands (gestures are simulated):\n"
              << "  a = point left, d = point right, s = point center, o = hand open (not pointing)\n"
              << "  f = fist (rotate), t = two fingers (hard drop)\n"
              << "  g = one gravity period, w = wait 1s\n"
              << "  p = start/pause, r = restart, q = quit\n";
}

} // namespace

int main(int argc, char** argv) {
    auto config = handtris::app::parseCommandLine(argc, argv);
    if (!config) {
        return 1;
    }

    try {
        // Time only moves when the user asks, so cooldowns are visible step by step
        handtris::controller::ManualClock clock;
        handtris::app::GameSession session{*config, clock};

        const auto period = config->controller.gravityInterval;
        // Each simulated gesture also lets this much time pass
        const std::chrono::milliseconds inputStep{200};

        if (!session.resumeSavedSession()) {
            session.start();
        }

        auto& gestures = session.gestures();

        std::string cmd;
        printGame(session.game());

        while (true) {
            std::cout << "\nEnter command: ";
            if (!std::getline(std::cin, cmd)) {
                break; // EOF
            }
            if (cmd.empty()) {
                continue;
            }

            const char c = cmd[0];
            if (c == 'q' || c == 'Q') {
                std::cout << "Quitting.\n";
                break;
            }

            handtris::app::GameSession::Duration elapsed{0};

            switch (c) {
            case 'a': case 'A':
                gestures.postPointer(0.2f, true);
                elapsed = inputStep;
                break;
            case 'd': case 'D':
                gestures.postPointer(0.8f, true);
                elapsed = inputStep;
                break;
            case 's': case 'S':
                gestures.postPointer(0.5f, true);
                elapsed = inputStep;
                break;
            case 'o': case 'O':
                gestures.postPointer(0.5f, false);
                elapsed = inputStep;
                break;
            case 'f': case 'F':
                gestures.postFist();
                elapsed = inputStep;
                break;
            case 't': case 'T':
                gestures.postTwoFinger();
                elapsed = inputStep;
                break;
            case 'g': case 'G':
                elapsed = period;
                break;
            case 'w': case 'W':
                elapsed = std::chrono::milliseconds{1000};
                break;
            case 'p': case 'P':
                session.togglePause();
                break;
            case 'r': case 'R':
                session.restart();
                session.start();
                break;
            default:
                std::cout << "Unknown command: " << c << '\n';
                break;
            }

            clock.advance(elapsed);
            session.frame(elapsed);

            printGame(session.game());

            if (session.game().isGameOver()) {
                std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
            }
        }

        session.suspend();
    } catch (const std::exception& e) {
        std::cerr << "[console] fatal: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
