#include "app/AppConfig.hpp"

#include <charconv>
#include <cstdio>
#include <string>

namespace handtris::app {

namespace {
    template <typename T>
    bool parseNumber(const char* text, T& out) {
        const std::string s{text};
        if (s.empty()) return false;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return ec == std::errc{} && ptr == s.data() + s.size();
    }
}

void printUsage(const char* program)
{
    std::fprintf(stderr,
                 "Usage: %s [options]\n"
                 "  --highscore <file>   high score file (default handtris_highscore.txt)\n"
                 "  --session <file>     session snapshot file (default handtris_session.txt)\n"
                 "  --seed <n>           fixed piece sequence\n"
                 "  --width <px>         window width\n"
                 "  --height <px>        window height\n",
                 program);
}

std::optional<AppConfig> parseCommandLine(int argc, char** argv)
{
    AppConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            printUsage(argv[0]);
            return std::nullopt;
        }

        if (i + 1 >= argc) {
            std::fprintf(stderr, "[app] missing value for %s\n", flag.c_str());
            printUsage(argv[0]);
            return std::nullopt;
        }
        const char* value = argv[++i];

        bool ok = true;
        if (flag == "--highscore") {
            config.highScorePath = value;
        } else if (flag == "--session") {
            config.sessionPath = value;
        } else if (flag == "--seed") {
            std::uint32_t seed = 0;
            ok = parseNumber(value, seed);
            if (ok) config.seed = seed;
        } else if (flag == "--width") {
            ok = parseNumber(value, config.windowWidth) && config.windowWidth > 0;
        } else if (flag == "--height") {
            ok = parseNumber(value, config.windowHeight) && config.windowHeight > 0;
        } else {
            std::fprintf(stderr, "[app] unknown option %s\n", flag.c_str());
            printUsage(argv[0]);
            return std::nullopt;
        }

        if (!ok) {
            std::fprintf(stderr, "[app] bad value for %s: %s\n", flag.c_str(), value);
            printUsage(argv[0]);
            return std::nullopt;
        }
    }

    return config;
}

} // namespace handtris::app
