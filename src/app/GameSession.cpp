#include "app/GameSession.hpp"

#include <cstdio>
#include <stdexcept>

namespace handtris::app {

core::GameState GameSession::makeGame(const AppConfig& config)
{
    if (config.seed) {
        return core::GameState{core::Board::DefaultRows, core::Board::DefaultCols, *config.seed};
    }
    return core::GameState{core::Board::DefaultRows, core::Board::DefaultCols};
}

GameSession::GameSession(const AppConfig& config, const controller::IClock& clock)
    : m_game(makeGame(config))
    , m_controller(m_game, clock, config.controller)
    , m_gestures(m_controller, clock, config.gestures)
    , m_highScores(config.highScorePath)
    , m_sessions(config.sessionPath)
{
    loadHighScore();
}

bool GameSession::resumeSavedSession()
{
    auto snapshot = m_sessions.load();
    if (!snapshot) {
        return false;
    }

    try {
        m_controller.restore(*snapshot);
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "[app] discarding saved session: %s\n", e.what());
        return false;
    }

    // The file may predate a better score stored since
    m_game.setHighScore(m_storedHighScore);
    m_gameOverReported = m_game.isGameOver();

    std::fprintf(stderr, "[app] resumed session (score %llu)\n",
                 static_cast<unsigned long long>(m_game.score()));
    return true;
}

void GameSession::start()
{
    m_controller.start();
}

void GameSession::pause()
{
    m_controller.pause();
}

void GameSession::togglePause()
{
    if (m_game.isGameOver()) {
        return;
    }
    if (m_game.isPaused() || !m_controller.isGravityRunning()) {
        m_controller.start();
    } else {
        m_controller.pause();
    }
}

void GameSession::restart()
{
    m_controller.reset();
    loadHighScore();
    m_gameOverReported = false;
}

void GameSession::frame(Duration elapsed)
{
    m_gestures.dispatchPending();
    m_controller.update(elapsed);

    persistHighScoreIfRaised();

    if (m_game.isGameOver() && !m_gameOverReported) {
        m_gameOverReported = true;
        std::fprintf(stderr, "[app] game over, final score %llu (high score %llu)\n",
                     static_cast<unsigned long long>(m_game.score()),
                     static_cast<unsigned long long>(m_game.highScore()));
    }
}

void GameSession::suspend()
{
    // Saved before pausing, so a running game resumes running
    const core::GameSnapshot snapshot = m_controller.save();
    m_controller.pause();
    persistHighScoreIfRaised();

    if (snapshot.isGameOver) {
        // Nothing worth resuming
        if (m_sessions.clear()) {
            std::fprintf(stderr, "[app] removed finished session %s\n", m_sessions.path().c_str());
        }
        return;
    }

    if (m_sessions.save(snapshot)) {
        std::fprintf(stderr, "[app] session saved to %s\n", m_sessions.path().c_str());
    }
}

void GameSession::loadHighScore()
{
    m_storedHighScore = m_highScores.load();
    m_game.setHighScore(m_storedHighScore);
}

void GameSession::persistHighScoreIfRaised()
{
    const std::uint64_t high = m_game.highScore();
    if (high <= m_storedHighScore) {
        return;
    }
    if (m_highScores.save(high)) {
        m_storedHighScore = high;
        std::fprintf(stderr, "[app] new high score %llu\n", static_cast<unsigned long long>(high));
    }
}

} // namespace handtris::app
