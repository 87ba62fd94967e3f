#pragma once

#include <cstdint>

#include "app/AppConfig.hpp"
#include "controller/Clock.hpp"
#include "controller/GameController.hpp"
#include "controller/GestureInputAdapter.hpp"
#include "core/GameState.hpp"
#include "storage/HighScoreStore.hpp"
#include "storage/SessionStore.hpp"

namespace handtris::app {

/// Everything one play session needs, wired together:
/// engine, controller, gesture adapter and the two stores.
/// Used by both frontends from their game thread.
class GameSession {
public:
    using Duration = controller::GameController::Duration;

    GameSession(const AppConfig& config, const controller::IClock& clock);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    const core::GameState& game() const noexcept { return m_game; }
    controller::GameController& controller() noexcept { return m_controller; }
    const controller::GameController& controller() const noexcept { return m_controller; }
    controller::GestureInputAdapter& gestures() noexcept { return m_gestures; }

    /// Restore the snapshot left by a previous suspend(), if any.
    bool resumeSavedSession();

    void start();
    void pause();
    void togglePause();

    /// Fresh game; the stored high score is reloaded. Stays paused until start().
    void restart();

    /// One frame on the game thread: apply queued gestures, advance gravity,
    /// persist a new high score.
    void frame(Duration elapsed);

    /// Persist everything (high score + the live snapshot), then pause.
    void suspend();

    std::uint64_t storedHighScore() const noexcept { return m_storedHighScore; }

private:
    core::GameState m_game;
    controller::GameController m_controller;
    controller::GestureInputAdapter m_gestures;

    storage::HighScoreStore m_highScores;
    storage::SessionStore m_sessions;

    std::uint64_t m_storedHighScore{0};
    bool m_gameOverReported{false};

    static core::GameState makeGame(const AppConfig& config);

    void loadHighScore();
    void persistHighScoreIfRaised();
};

} // namespace handtris::app
