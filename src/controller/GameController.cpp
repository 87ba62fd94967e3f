#include "controller/GameController.hpp"

namespace handtris::controller {

GameController::GameController(core::GameState& game, const IClock& clock,
                               ControllerConfig config)
    : game_{game}
    , clock_{clock}
    , config_{config}
{
    config_.validate();
}

void GameController::start() {
    if (!game_.currentPiece()) {
        game_.spawnPiece();
    }
    game_.setPaused(false);
    gravityRunning_ = true;
    accumulated_ = Duration{0};
}

void GameController::pause() {
    game_.setPaused(true);
    stopGravity();
}

void GameController::reset() {
    game_.reset();
    stopGravity();

    lastLock_.reset();
    lastHardDrop_.reset();
    lastRotate_.reset();
    lastMove_.reset();
    lastPointerX_.reset();
}

void GameController::update(Duration elapsed) {
    if (!gravityRunning_) {
        return;
    }

    accumulated_ += elapsed;

    // If a lot of time passed (lag), we might need several ticks
    while (gravityRunning_ && accumulated_ >= config_.gravityInterval) {
        accumulated_ -= config_.gravityInterval;
        gravityTick();
    }
}

void GameController::gravityTick() {
    if (game_.isPaused() || game_.isGameOver()) {
        return;
    }

    if (!game_.currentPiece()) {
        game_.spawnPiece();
        return;
    }

    const TimePoint now = clock_.now();

    // Slow fall: nothing moves until dropCooldown has passed since the last lock
    if (!hasElapsed(lastLock_, config_.dropCooldown, now)) {
        return;
    }

    if (game_.moveDown()) {
        return;
    }

    afterLock(game_.lockAndSpawn(), now);
}

bool GameController::handlePointer(float x, bool isPointing) {
    lastPointerX_ = x;

    if (!canAct() || !isPointing) {
        return false;
    }

    const TimePoint now = clock_.now();
    if (!hasElapsed(lastMove_, config_.moveDelay, now)) {
        return false;
    }

    bool moved = false;
    if (x < config_.leftZone) {
        moved = game_.moveLeft();
    } else if (x > config_.rightZone) {
        moved = game_.moveRight();
    }
    // else: dead zone

    if (moved) {
        lastMove_ = now;
    }
    return moved;
}

bool GameController::requestRotate() {
    const TimePoint now = clock_.now();
    if (!hasElapsed(lastRotate_, config_.rotationCooldown, now)) {
        return false;
    }
    if (!canAct()) {
        return false;
    }

    // A refused rotation charges no cooldown
    if (!game_.rotate()) {
        return false;
    }
    lastRotate_ = now;
    return true;
}

bool GameController::requestHardDrop() {
    if (!canAct()) {
        return false;
    }

    const TimePoint now = clock_.now();
    if (!hasElapsed(lastHardDrop_, config_.hardDropCooldown, now)) {
        return false;
    }

    auto result = game_.hardDrop();
    if (!result) {
        return false;
    }
    afterLock(*result, now);
    lastHardDrop_ = now;
    return true;
}

void GameController::restore(const core::GameSnapshot& snapshot) {
    game_.restore(snapshot);

    accumulated_ = Duration{0};
    gravityRunning_ = !snapshot.isPaused && !snapshot.isGameOver;
}

bool GameController::canAct() const noexcept {
    return !game_.isPaused() && !game_.isGameOver() && game_.currentPiece().has_value();
}

bool GameController::hasElapsed(const std::optional<TimePoint>& since, Duration window,
                                TimePoint now) const noexcept {
    if (!since) {
        return true;
    }
    return now - *since >= window;
}

void GameController::stopGravity() noexcept {
    gravityRunning_ = false;
    accumulated_ = Duration{0};
}

void GameController::afterLock(const core::LockResult& result, TimePoint now) {
    lastLock_ = now;
    if (result.gameOver) {
        stopGravity();
    }
}

} // namespace handtris::controller
