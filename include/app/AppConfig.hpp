#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "controller/ControllerConfig.hpp"
#include "controller/GestureInputAdapter.hpp"

namespace handtris::app {

struct AppConfig {
    int windowWidth{900};
    int windowHeight{760};

    std::string highScorePath{"handtris_highscore.txt"};
    std::string sessionPath{"handtris_session.txt"};

    std::optional<std::uint32_t> seed; // random when unset

    controller::ControllerConfig controller{};
    controller::GestureAdapterConfig gestures{};
};

/// Parse `--key value` overrides on top of the defaults.
/// Prints usage to stderr and returns std::nullopt on unknown flags or bad values.
std::optional<AppConfig> parseCommandLine(int argc, char** argv);

void printUsage(const char* program);

} // namespace handtris::app
