#pragma once

/// @file arrival_simulator.hpp
/// @brief Random player arrivals fed one by one through a MatchmakingSystem.
///
/// The simulator is the reference driver of the matchmaking core: each
/// arrival is inserted and followed by exactly one match attempt before the
/// next arrival is processed.

#include <cstdint>
#include <functional>
#include <vector>

#include "lineup/foundation/lineup_result.hpp"
#include "lineup/matchmaking/matchmaking_system.hpp"
#include "lineup/simulation/simulation_config.hpp"

namespace lineup::simulation {

/// A player arriving at the queue.
struct ArrivalEvent {
    double arrivalTime = 0.0;
    int32_t rating = 0;
    int32_t form = 0;
};

/// Totals of a simulation run.
struct SimulationReport {
    uint32_t totalPlayers = 0;
    uint64_t matchesCreated = 0;
    uint64_t playersMatched = 0;
    std::size_t playersInQueue = 0;
    double finalTime = 0.0;    ///< Arrival time of the last processed event.
    double averageWait = 0.0;  ///< Mean wait of matched players, 0 if none.
    std::vector<lineup::matchmaking::Match> matches;
};

/// Observer called for every arrival and every formed match.
struct SimulationObserver {
    std::function<void(const ArrivalEvent&, lineup::matchmaking::PlayerId)> onArrival;
    std::function<void(const lineup::matchmaking::Match&)> onMatch;
};

/// Draw numPlayers arrivals with uniform time, rating and form, sorted by
/// arrival time. The same seed yields the same events.
[[nodiscard]] std::vector<ArrivalEvent> generateArrivals(const SimulationConfig& config);

/// Drives a MatchmakingSystem with arrival events.
///
/// Usage:
/// @code
///   auto sim = ArrivalSimulator::create(config);
///   if (sim) {
///       auto report = sim.value().run(generateArrivals(config));
///   }
/// @endcode
class ArrivalSimulator {
public:
    /// Validate the configuration and build the matchmaking system.
    [[nodiscard]] static lineup::foundation::LineupResult<ArrivalSimulator> create(
        SimulationConfig config);

    /// Process events in the given order: insert, then one match attempt.
    SimulationReport run(const std::vector<ArrivalEvent>& events,
                         const SimulationObserver& observer = {});

    [[nodiscard]] const SimulationConfig& config() const noexcept;

    [[nodiscard]] const lineup::matchmaking::MatchmakingSystem& system() const noexcept;

private:
    ArrivalSimulator(SimulationConfig config, lineup::matchmaking::MatchmakingSystem system);

    SimulationConfig config_;
    lineup::matchmaking::MatchmakingSystem system_;
};

/// Generate arrivals from config and run them through a fresh simulator.
[[nodiscard]] lineup::foundation::LineupResult<SimulationReport> runSimulation(
    const SimulationConfig& config, const SimulationObserver& observer = {});

}  // namespace lineup::simulation
