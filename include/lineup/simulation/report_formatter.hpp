#pragma once

/// @file report_formatter.hpp
/// @brief Console narration for simulation runs.

#include <string>

#include "lineup/matchmaking/matchmaking_types.hpp"
#include "lineup/simulation/arrival_simulator.hpp"

namespace lineup::simulation {

/// Header block listing the run parameters.
[[nodiscard]] std::string formatBanner(const SimulationConfig& config);

/// One line per arrival: time, id, rating, form.
[[nodiscard]] std::string formatArrival(const ArrivalEvent& event,
                                        lineup::matchmaking::PlayerId id);

/// Match announcement listing both teams, rating span, balance and wait.
[[nodiscard]] std::string formatMatch(const lineup::matchmaking::Match& match);

/// Closing summary block.
[[nodiscard]] std::string formatSummary(const SimulationReport& report);

}  // namespace lineup::simulation
