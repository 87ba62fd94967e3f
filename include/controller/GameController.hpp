#pragma once

#include "core/GameState.hpp"
#include "core/GameSnapshot.hpp"
#include "controller/Clock.hpp"
#include "controller/ControllerConfig.hpp"
#include <chrono>
#include <optional>

namespace handtris::controller {

/// Drives a GameState in time: the gravity clock, the cooldown gates and the
/// pointer-zone mapping. Every entry point checks the paused and game-over
/// flags on its own.
///
/// All calls must come from one thread (the game thread). Producers on other
/// threads go through GestureInputAdapter.
class GameController {
public:
    using Duration = ControllerConfig::Duration;
    using TimePoint = IClock::TimePoint;

    /// Controller does not own the GameState or the clock; caller keeps them alive.
    GameController(core::GameState& game, const IClock& clock,
                   ControllerConfig config = ControllerConfig{});

    /// Spawn a piece if there is none, clear the paused flag, enable gravity.
    void start();

    /// Set the paused flag and stop the gravity clock.
    void pause();

    /// Reset the game (high score kept), clear every cooldown timer and stop
    /// the gravity clock.
    void reset();

    // Called periodically with elapsed time since last call.
    // While the gravity clock runs, fires one gravityTick() per full interval.
    void update(Duration elapsed);

    /// One gravity evaluation. No-op when paused or over.
    void gravityTick();

    /// Pointer event with a normalized horizontal position.
    /// Returns true if the piece moved.
    bool handlePointer(float x, bool isPointing);

    /// Returns true if the piece rotated.
    bool requestRotate();

    /// Returns true if a hard drop happened.
    bool requestHardDrop();

    core::GameSnapshot save() const { return game_.save(); }

    /// Restore a snapshot and resume gravity unless it is paused or over.
    /// Throws std::invalid_argument (nothing changed) for an invalid snapshot.
    void restore(const core::GameSnapshot& snapshot);

    bool isGravityRunning() const noexcept { return gravityRunning_; }
    std::optional<float> lastPointerX() const noexcept { return lastPointerX_; }

    const core::GameState& game() const noexcept { return game_; }
    const ControllerConfig& config() const noexcept { return config_; }

private:
    core::GameState& game_;
    const IClock& clock_;
    ControllerConfig config_;

    bool gravityRunning_{false};
    Duration accumulated_{0};

    // Unset means "never happened", which always passes the gate
    std::optional<TimePoint> lastLock_;
    std::optional<TimePoint> lastHardDrop_;
    std::optional<TimePoint> lastRotate_;
    std::optional<TimePoint> lastMove_;

    std::optional<float> lastPointerX_;

    bool canAct() const noexcept;
    bool hasElapsed(const std::optional<TimePoint>& since, Duration window, TimePoint now) const noexcept;
    void stopGravity() noexcept;
    void afterLock(const core::LockResult& result, TimePoint now);
};

} // namespace handtris::controller
