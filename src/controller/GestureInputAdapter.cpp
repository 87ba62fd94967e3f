#include "controller/GestureInputAdapter.hpp"

#include <utility>

namespace handtris::controller {

GestureInputAdapter::GestureInputAdapter(GameController& controller, const IClock& clock,
                                         GestureAdapterConfig config)
    : controller_{controller}
    , clock_{clock}
    , config_{config}
{
}

void GestureInputAdapter::post(const GestureEvent& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    queue_.push_back(event);
}

void GestureInputAdapter::connect(IGestureSource& source) {
    source.setGestureHandler([this](const GestureEvent& event) {
        post(event);
    });
}

std::size_t GestureInputAdapter::dispatchPending() {
    std::vector<GestureEvent> events;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        events.swap(queue_);
    }

    for (const auto& e : events) {
        apply(e);
    }
    return events.size();
}

std::size_t GestureInputAdapter::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

void GestureInputAdapter::apply(const GestureEvent& event) {
    switch (event.kind) {
    case GestureKind::PointerMoved:
        onPointerMoved(event.x, event.isPointing);
        break;
    case GestureKind::Fist:
        onFist();
        break;
    case GestureKind::TwoFinger:
        onTwoFinger();
        break;
    }
}

void GestureInputAdapter::onPointerMoved(float x, bool isPointing) {
    controller_.handlePointer(x, isPointing);
}

void GestureInputAdapter::onFist() {
    if (passDebounce(lastFist_)) {
        controller_.requestRotate();
    }
}

void GestureInputAdapter::onTwoFinger() {
    if (passDebounce(lastTwoFinger_)) {
        controller_.requestHardDrop();
    }
}

bool GestureInputAdapter::passDebounce(std::optional<TimePoint>& last) {
    const TimePoint now = clock_.now();
    if (last && now - *last <= config_.triggerDebounce) {
        return false;
    }
    last = now;
    return true;
}

} // namespace handtris::controller
