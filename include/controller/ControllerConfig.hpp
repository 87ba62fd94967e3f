#pragma once

#include <chrono>

namespace handtris::controller {

struct ControllerConfig {
    using Duration = std::chrono::milliseconds;

    Duration gravityInterval{500};    // period of the gravity tick
    Duration dropCooldown{5000};      // gravity waits this long after every lock
    Duration hardDropCooldown{1500};
    Duration rotationCooldown{800};
    Duration moveDelay{150};          // between two lateral moves

    // Normalized pointer zones: x < leftZone moves left, x > rightZone moves right
    float leftZone{0.4f};
    float rightZone{0.6f};

    /// Throws std::invalid_argument if any value is unusable.
    void validate() const;
};

} // namespace handtris::controller
