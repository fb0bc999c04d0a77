#pragma once

/// @file app_runner.hpp
/// @brief Command-line and configuration helpers for lineup executables.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "lineup/foundation/config_manager.hpp"
#include "lineup/foundation/lineup_result.hpp"

namespace lineup::app {

/// Environment variable overriding the config file path.
inline constexpr const char* kConfigPathEnv = "LINEUP_CONFIG_PATH";

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The path is resolved in order:
///   1. LINEUP_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] lineup::foundation::LineupResult<void>
loadConfig(lineup::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Return the value following `--<name>` in argv, if present.
[[nodiscard]] std::optional<std::string>
parseOptionArg(int argc, char* argv[], std::string_view name);

/// Parse `--config <path>`.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Copy `--players` and `--seed` onto simulation.num_players and
/// simulation.seed. Values are stored as given; type errors surface when
/// the keys are read.
void applyOptionOverrides(int argc, char* argv[], lineup::foundation::ConfigManager& config);

} // namespace lineup::app
