/// @file app_runner.cpp
/// @brief Command-line and configuration helpers for lineup executables.

#include "lineup/app/app_runner.hpp"

#include <cstdlib>

namespace lineup::app {

lineup::foundation::LineupResult<void>
loadConfig(lineup::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

std::optional<std::string> parseOptionArg(int argc, char* argv[], std::string_view name) {
    std::string flag = "--" + std::string(name);
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    auto value = parseOptionArg(argc, argv, "config");
    if (!value) {
        return {};
    }
    return *value;
}

void applyOptionOverrides(int argc, char* argv[], lineup::foundation::ConfigManager& config) {
    if (auto players = parseOptionArg(argc, argv, "players")) {
        config.set("simulation.num_players", *players);
    }
    if (auto seed = parseOptionArg(argc, argv, "seed")) {
        config.set("simulation.seed", *seed);
    }
}

} // namespace lineup::app
