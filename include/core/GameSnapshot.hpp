#pragma once

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace handtris::core {

struct CurrentPieceSnapshot {
    PieceType type{PieceType::I};
    int rotation{0}; // quarter turns, [0, 4)
    int x{0};
    int y{0};

    bool operator==(const CurrentPieceSnapshot& o) const noexcept {
        return type == o.type && rotation == o.rotation && x == o.x && y == o.y;
    }
    bool operator!=(const CurrentPieceSnapshot& o) const noexcept { return !(*this == o); }
};

// Full engine state, enough to resume after a transient interruption.
struct GameSnapshot {
    int rows{0};
    int cols{0};
    std::vector<Color> cells; // row-major, rows * cols

    std::uint64_t score{0};
    std::uint64_t highScore{0};

    bool isGameOver{false};
    bool isPaused{false};

    std::optional<CurrentPieceSnapshot> currentPiece;
    PieceType nextPieceType{PieceType::I};

    bool operator==(const GameSnapshot& o) const noexcept {
        return rows == o.rows && cols == o.cols && cells == o.cells
            && score == o.score && highScore == o.highScore
            && isGameOver == o.isGameOver && isPaused == o.isPaused
            && currentPiece == o.currentPiece && nextPieceType == o.nextPieceType;
    }
    bool operator!=(const GameSnapshot& o) const noexcept { return !(*this == o); }
};

/// Check that `snapshot` can be applied to a rows x cols board: dimensions,
/// colors, piece ordinals, rotation, and a current piece whose cells lie in
/// [0, cols) x (-inf, rows).
/// Returns std::nullopt if it is acceptable, otherwise a description of the
/// first problem found.
std::optional<std::string> validateSnapshot(const GameSnapshot& snapshot, int rows, int cols);

} // namespace handtris::core
