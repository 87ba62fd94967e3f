#pragma once

#include <cstdint>

namespace handtris::core {

// Current score and the session high score.
// The high score never decreases through play; it follows the score upward.
class ScoreManager {
public:
    // Points for clearing `lines` rows in one pass: 1/2/3/4 -> 100/300/500/800,
    // anything else lines * 100 (0 for 0)
    static std::uint64_t pointsForLines(int lines) noexcept;

    // Returns the points awarded
    std::uint64_t addLinesCleared(int lines);

    std::uint64_t score() const noexcept { return score_; }
    std::uint64_t highScore() const noexcept { return highScore_; }

    // Raise-only: a lower value is ignored
    void setHighScore(std::uint64_t value) noexcept;

    // Exact values, used when restoring a snapshot
    void restore(std::uint64_t score, std::uint64_t highScore) noexcept;

    void reset() noexcept { score_ = 0; }

private:
    std::uint64_t score_{0};
    std::uint64_t highScore_{0};
};

} // namespace handtris::core
