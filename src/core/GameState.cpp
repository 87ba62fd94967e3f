#include "core/GameState.hpp"

#include <stdexcept>

namespace handtris::core {

GameState::GameState(int rows, int cols)
    : board_{rows, cols}
    , factory_{}
    , scoreManager_{}
    , currentPiece_{}
    , nextPiece_{factory_.createRandom()}
{
}

GameState::GameState(int rows, int cols, std::uint32_t seed)
    : board_{rows, cols}
    , factory_{seed}
    , scoreManager_{}
    , currentPiece_{}
    , nextPiece_{factory_.createRandom()}
{
}

GameStatus GameState::status() const noexcept {
    if (isGameOver_) return GameStatus::GameOver;
    if (isPaused_) return GameStatus::Paused;
    return GameStatus::Running;
}

void GameState::reset() {
    board_.clear();
    scoreManager_.reset();
    currentPiece_.reset();
    nextPiece_ = factory_.createRandom();
    isGameOver_ = false;
    isPaused_ = true;
    lockedPieces_ = 0;
}

void GameState::spawnPiece() {
    Tetromino piece = nextPiece_;
    piece.setRotation(Rotation::R0);
    const int size = piece.shape().size;
    piece.setPosition((board_.cols() - size) / 2, 0);

    currentPiece_ = piece;
    nextPiece_ = factory_.createRandom();
}

bool GameState::moveLeft() {
    return tryMove(-1, 0);
}

bool GameState::moveRight() {
    return tryMove(1, 0);
}

bool GameState::moveDown() {
    return tryMove(0, 1);
}

bool GameState::rotate() {
    if (!currentPiece_) return false;

    const Rotation original = currentPiece_->rotation();
    currentPiece_->rotateClockwise();

    if (board_.isCollision(*currentPiece_)) {
        // No wall kicks: a colliding rotation is simply refused
        currentPiece_->setRotation(original);
        return false;
    }
    return true;
}

std::optional<int> GameState::dropRow() const noexcept {
    if (!currentPiece_) return std::nullopt;
    return board_.findDropRow(*currentPiece_);
}

int GameState::checkCompletedRows() {
    const int lines = board_.clearCompletedRows();
    if (lines > 0) {
        scoreManager_.addLinesCleared(lines);
    }
    return lines;
}

LockResult GameState::lockAndSpawn() {
    if (!currentPiece_) {
        throw std::logic_error("GameState::lockAndSpawn without a current piece");
    }

    LockResult result{};

    board_.lockTetromino(*currentPiece_);
    ++lockedPieces_;

    const std::uint64_t before = scoreManager_.score();
    result.linesCleared = checkCompletedRows();
    result.points = scoreManager_.score() - before;

    spawnPiece();

    if (board_.isCollision(*currentPiece_)) {
        isGameOver_ = true;
        result.gameOver = true;
    }
    return result;
}

std::optional<LockResult> GameState::hardDrop() {
    if (!currentPiece_) return std::nullopt;

    const int target = board_.findDropRow(*currentPiece_);
    while (currentPiece_->y() < target) {
        currentPiece_->moveDown();
    }
    return lockAndSpawn();
}

GameSnapshot GameState::save() const {
    GameSnapshot s;
    s.rows = board_.rows();
    s.cols = board_.cols();
    s.cells = board_.cells();
    s.score = scoreManager_.score();
    s.highScore = scoreManager_.highScore();
    s.isGameOver = isGameOver_;
    s.isPaused = isPaused_;
    if (currentPiece_) {
        s.currentPiece = CurrentPieceSnapshot{
            currentPiece_->type(),
            static_cast<int>(currentPiece_->rotation()),
            currentPiece_->x(),
            currentPiece_->y()
        };
    }
    s.nextPieceType = nextPiece_.type();
    return s;
}

void GameState::restore(const GameSnapshot& snapshot) {
    if (auto problem = validateSnapshot(snapshot, board_.rows(), board_.cols())) {
        throw std::invalid_argument("GameState::restore rejected snapshot: " + *problem);
    }

    // Nothing below can fail
    board_.assign(snapshot.cells);
    scoreManager_.restore(snapshot.score, snapshot.highScore);
    isGameOver_ = snapshot.isGameOver;
    isPaused_ = snapshot.isPaused;

    if (snapshot.currentPiece) {
        const auto& p = *snapshot.currentPiece;
        currentPiece_ = Tetromino{p.type, static_cast<Rotation>(p.rotation), p.x, p.y};
    } else {
        currentPiece_.reset();
    }
    nextPiece_ = Tetromino{snapshot.nextPieceType};
}

bool GameState::tryMove(int dx, int dy) {
    if (!currentPiece_) return false;

    if (!board_.canMove(*currentPiece_, dx, dy)) {
        return false;
    }
    currentPiece_->setPosition(currentPiece_->x() + dx, currentPiece_->y() + dy);
    return true;
}

} // namespace handtris::core
