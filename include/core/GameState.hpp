#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "TetrominoFactory.hpp"
#include "ScoreManager.hpp"
#include "GameSnapshot.hpp"
#include <cstdint>
#include <optional>

namespace handtris::core {

// Derived view of the two flags, for display
enum class GameStatus {
    Running,
    Paused,
    GameOver
};

// Outcome of locking the current piece and spawning the next one
struct LockResult {
    int linesCleared{0};
    std::uint64_t points{0};
    bool gameOver{false};
};

// Rules engine: board, current/next piece, score and the paused/over flags.
// It has no notion of time; GameController decides when things happen.
class GameState {
public:
    GameState(int rows = Board::DefaultRows, int cols = Board::DefaultCols);
    GameState(int rows, int cols, std::uint32_t seed);

    const Board& board() const noexcept { return board_; }
    const std::optional<Tetromino>& currentPiece() const noexcept { return currentPiece_; }
    const Tetromino& nextPiece() const noexcept { return nextPiece_; }

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    std::uint64_t highScore() const noexcept { return scoreManager_.highScore(); }
    void setHighScore(std::uint64_t value) noexcept { scoreManager_.setHighScore(value); }

    bool isGameOver() const noexcept { return isGameOver_; }
    bool isPaused() const noexcept { return isPaused_; }
    void setPaused(bool paused) noexcept { isPaused_ = paused; }
    GameStatus status() const noexcept;

    // Number of pieces locked since construction or the last reset
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }

    // Empty board, score 0 (high score kept), no current piece, fresh next
    // piece, not over, paused
    void reset();

    // Promote the next piece to current at the spawn pose and roll a new next.
    // Does not check collision.
    void spawnPiece();

    // Legality-checked moves; false if blocked or there is no current piece
    bool moveLeft();
    bool moveRight();
    bool moveDown();

    // Rotate clockwise; a colliding result is rolled back and false returned
    bool rotate();

    // Ghost row of the current piece
    std::optional<int> dropRow() const noexcept;

    // Clear complete rows and add their points; returns the rows cleared
    int checkCompletedRows();

    // Lock the current piece, clear rows, spawn the next piece and flag game
    // over if it collides at its spawn pose. Requires a current piece.
    LockResult lockAndSpawn();

    // Move the current piece to its drop row, then lockAndSpawn()
    std::optional<LockResult> hardDrop();

    GameSnapshot save() const;

    // Throws std::invalid_argument (state untouched) if the snapshot does not
    // pass validateSnapshot for this board
    void restore(const GameSnapshot& snapshot);

private:
    Board board_;
    TetrominoFactory factory_;
    ScoreManager scoreManager_;

    std::optional<Tetromino> currentPiece_;
    Tetromino nextPiece_;

    bool isGameOver_{false};
    bool isPaused_{false};
    std::uint64_t lockedPieces_{0};

    // Helper to try move current piece by dx, dy
    bool tryMove(int dx, int dy);
};

} // namespace handtris::core
