/// @file simulation_config.cpp
/// @brief SimulationConfig validation and YAML mapping.

#include "lineup/simulation/simulation_config.hpp"

#include <string>
#include <utility>

#include "lineup/foundation/error_code.hpp"

namespace lineup::simulation {

using lineup::foundation::ConfigManager;
using lineup::foundation::ErrorCode;
using lineup::foundation::LineupError;
using lineup::foundation::LineupResult;

namespace {

LineupResult<void> invalid(std::string message) {
    return LineupResult<void>::err(
        LineupError(ErrorCode::InvalidSimulationConfig, std::move(message)));
}

/// Copy the value at key into target if the key exists.
/// A present key with the wrong type is an error.
template <typename T>
LineupResult<void> readOptional(const ConfigManager& config, const char* key, T& target) {
    if (!config.hasKey(key)) {
        return LineupResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return LineupResult<void>::err(value.error());
    }
    target = value.value();
    return LineupResult<void>::ok();
}

} // namespace

LineupResult<void> validate(const SimulationConfig& config) {
    if (config.numPlayers == 0) {
        return invalid("numPlayers must be positive");
    }
    if (!(config.maxTime > 0.0)) {
        return invalid("maxTime must be positive");
    }
    if (config.minRating > config.maxRating) {
        return invalid("minRating is above maxRating");
    }
    if (config.minForm > config.maxForm) {
        return invalid("minForm is above maxForm");
    }
    if (config.matchmaking.maxRatingDistance < 0) {
        return invalid("maxRatingDistance must be non-negative");
    }
    return LineupResult<void>::ok();
}

LineupResult<SimulationConfig> buildSimulationConfig(const ConfigManager& config) {
    SimulationConfig cfg;

    LineupResult<void> reads[] = {
        readOptional(config, "simulation.num_players", cfg.numPlayers),
        readOptional(config, "simulation.max_time_seconds", cfg.maxTime),
        readOptional(config, "simulation.min_rating", cfg.minRating),
        readOptional(config, "simulation.max_rating", cfg.maxRating),
        readOptional(config, "simulation.min_form", cfg.minForm),
        readOptional(config, "simulation.max_form", cfg.maxForm),
        readOptional(config, "matchmaking.max_rating_distance",
                     cfg.matchmaking.maxRatingDistance),
    };
    for (const auto& read : reads) {
        if (!read) {
            return LineupResult<SimulationConfig>::err(read.error());
        }
    }

    if (config.hasKey("simulation.seed")) {
        auto seed = config.get<uint64_t>("simulation.seed");
        if (!seed) {
            return LineupResult<SimulationConfig>::err(seed.error());
        }
        cfg.seed = seed.value();
    }

    return LineupResult<SimulationConfig>::ok(cfg);
}

}  // namespace lineup::simulation
