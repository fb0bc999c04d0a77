#pragma once

/// @file simulation_config.hpp
/// @brief Parameters of the arrival simulator and their YAML mapping.

#include <cstdint>
#include <optional>

#include "lineup/foundation/config_manager.hpp"
#include "lineup/foundation/lineup_result.hpp"
#include "lineup/matchmaking/matchmaking_types.hpp"

namespace lineup::simulation {

/// Arrival simulation parameters.
///
/// Defaults reproduce a 50 players/minute arrival rate over four minutes
/// with a 200 point rating window.
struct SimulationConfig {
    uint32_t numPlayers = 200;
    double maxTime = 240.0;  ///< Arrival times are uniform in [0, maxTime] seconds.
    int32_t minRating = 1000;
    int32_t maxRating = 3000;
    int32_t minForm = lineup::matchmaking::kMinForm;
    int32_t maxForm = lineup::matchmaking::kMaxForm;
    std::optional<uint64_t> seed = 42;  ///< nullopt draws a random seed.

    lineup::matchmaking::MatchmakingConfig matchmaking;
};

/// Check the parameters for values no simulation can run with.
///
/// @return InvalidSimulationConfig naming the first bad field.
[[nodiscard]] lineup::foundation::LineupResult<void> validate(const SimulationConfig& config);

/// Read a SimulationConfig from configuration keys, keeping the default
/// for every key that is absent.
///
/// Keys: simulation.num_players, simulation.max_time_seconds,
/// simulation.seed, simulation.min_rating, simulation.max_rating,
/// simulation.min_form, simulation.max_form,
/// matchmaking.max_rating_distance.
///
/// @return ConfigTypeMismatch if a present key has the wrong type.
[[nodiscard]] lineup::foundation::LineupResult<SimulationConfig> buildSimulationConfig(
    const lineup::foundation::ConfigManager& config);

}  // namespace lineup::simulation
