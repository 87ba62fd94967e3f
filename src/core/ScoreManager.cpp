#include "core/ScoreManager.hpp"

namespace handtris::core {

std::uint64_t ScoreManager::pointsForLines(int lines) noexcept {
    if (lines <= 0) return 0;

    switch (lines) {
    case 1: return 100;
    case 2: return 300;
    case 3: return 500;
    case 4: return 800;
    default:
        return static_cast<std::uint64_t>(lines) * 100U;
    }
}

std::uint64_t ScoreManager::addLinesCleared(int lines) {
    const std::uint64_t points = pointsForLines(lines);
    if (points == 0) return 0;

    score_ += points;
    if (score_ > highScore_) {
        highScore_ = score_;
    }
    return points;
}

void ScoreManager::setHighScore(std::uint64_t value) noexcept {
    if (value > highScore_) {
        highScore_ = value;
    }
}

void ScoreManager::restore(std::uint64_t score, std::uint64_t highScore) noexcept {
    score_ = score;
    highScore_ = highScore;
}

} // namespace handtris::core
