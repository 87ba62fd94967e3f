#pragma once

#include <chrono>

namespace handtris::controller {

/// Monotonic time source for cooldown gates.
/// Injected so that tests can drive time by hand.
class IClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;
};

class SteadyClock final : public IClock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/// Clock that only moves when told to (console stepping, tests).
class ManualClock final : public IClock {
public:
    TimePoint now() const override { return now_; }

    void advance(std::chrono::milliseconds d) { now_ += d; }

private:
    // Arbitrary non-zero origin
    TimePoint now_{std::chrono::hours{1}};
};

} // namespace handtris::controller
