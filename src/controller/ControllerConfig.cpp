#include "controller/ControllerConfig.hpp"

#include <stdexcept>

namespace handtris::controller {

void ControllerConfig::validate() const {
    if (gravityInterval <= Duration{0}) {
        throw std::invalid_argument("ControllerConfig: gravityInterval must be positive");
    }
    if (dropCooldown < Duration{0} || hardDropCooldown < Duration{0}
        || rotationCooldown < Duration{0} || moveDelay < Duration{0}) {
        throw std::invalid_argument("ControllerConfig: cooldowns must not be negative");
    }
    if (!(leftZone >= 0.0f && leftZone <= rightZone && rightZone <= 1.0f)) {
        throw std::invalid_argument("ControllerConfig: zones must satisfy 0 <= left <= right <= 1");
    }
}

} // namespace handtris::controller
