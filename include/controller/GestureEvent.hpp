#pragma once

#include <functional>

namespace handtris::controller {

// Events emitted by the hand-tracking collaborator.
// These are platform-agnostic: camera, mouse simulator, scripted input, etc.
enum class GestureKind {
    PointerMoved, // index finger position, sent at frame rate
    Fist,
    TwoFinger
};

struct GestureEvent {
    GestureKind kind{GestureKind::PointerMoved};
    float x{0.0f};          // normalized horizontal position, PointerMoved only
    bool isPointing{false}; // index finger extended, PointerMoved only

    static GestureEvent pointer(float x, bool isPointing) {
        return GestureEvent{GestureKind::PointerMoved, x, isPointing};
    }
    static GestureEvent fist() { return GestureEvent{GestureKind::Fist, 0.0f, false}; }
    static GestureEvent twoFinger() { return GestureEvent{GestureKind::TwoFinger, 0.0f, false}; }
};

/// Producer of gesture events (the hand tracker or a stand-in for it).
class IGestureSource {
public:
    using GestureHandler = std::function<void(const GestureEvent&)>;

    virtual ~IGestureSource() = default;

    // Set callback invoked for every gesture. It may be called from any thread.
    virtual void setGestureHandler(GestureHandler handler) = 0;

    // Give the source a chance to emit; sources with their own thread may no-op.
    virtual void poll() = 0;
};

} // namespace handtris::controller
