#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "controller/Clock.hpp"
#include "controller/GameController.hpp"
#include "controller/GestureEvent.hpp"

namespace handtris::controller {

struct GestureAdapterConfig {
    // A trigger of the same kind arriving within this window is dropped
    std::chrono::milliseconds triggerDebounce{1000};
};

/// Maps gesture events onto controller calls.
///
/// Fixed mapping:
///   PointerMoved -> GameController::handlePointer
///   Fist         -> GameController::requestRotate
///   TwoFinger    -> GameController::requestHardDrop
///
/// post*() may be called from any thread and only enqueue.
/// dispatchPending() and the on*() handlers run on the game thread.
class GestureInputAdapter {
public:
    using TimePoint = IClock::TimePoint;

    GestureInputAdapter(GameController& controller, const IClock& clock,
                        GestureAdapterConfig config = GestureAdapterConfig{});

    GestureInputAdapter(const GestureInputAdapter&) = delete;
    GestureInputAdapter& operator=(const GestureInputAdapter&) = delete;

    // Thread-safe producers
    void post(const GestureEvent& event);
    void postPointer(float x, bool isPointing) { post(GestureEvent::pointer(x, isPointing)); }
    void postFist() { post(GestureEvent::fist()); }
    void postTwoFinger() { post(GestureEvent::twoFinger()); }

    /// Route events from a source into this adapter's queue.
    void connect(IGestureSource& source);

    /// Apply every queued event in arrival order. Returns how many were applied.
    std::size_t dispatchPending();

    std::size_t pendingCount() const;

    // Game-thread handlers
    void onPointerMoved(float x, bool isPointing);
    void onFist();
    void onTwoFinger();
    void apply(const GestureEvent& event);

private:
    GameController& controller_;
    const IClock& clock_;
    GestureAdapterConfig config_;

    mutable std::mutex queueMutex_;
    std::vector<GestureEvent> queue_;

    std::optional<TimePoint> lastFist_;
    std::optional<TimePoint> lastTwoFinger_;

    bool passDebounce(std::optional<TimePoint>& last);
};

} // namespace handtris::controller
