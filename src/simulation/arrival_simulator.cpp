/// @file arrival_simulator.cpp
/// @brief ArrivalSimulator implementation.

#include "lineup/simulation/arrival_simulator.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <utility>

#include "lineup/foundation/logger.hpp"

namespace lineup::simulation {

using lineup::foundation::LineupResult;
using lineup::foundation::LogCategory;
using lineup::foundation::LogContext;
using lineup::foundation::LogLevel;
using lineup::foundation::Logger;
using lineup::matchmaking::MatchmakingSystem;

std::vector<ArrivalEvent> generateArrivals(const SimulationConfig& config) {
    std::mt19937_64 rng(config.seed ? *config.seed : std::random_device{}());
    std::uniform_real_distribution<double> timeDist(0.0, config.maxTime);
    std::uniform_int_distribution<int32_t> ratingDist(config.minRating, config.maxRating);
    std::uniform_int_distribution<int32_t> formDist(config.minForm, config.maxForm);

    std::vector<ArrivalEvent> events;
    events.reserve(config.numPlayers);
    for (uint32_t i = 0; i < config.numPlayers; ++i) {
        ArrivalEvent event;
        event.arrivalTime = timeDist(rng);
        event.rating = ratingDist(rng);
        event.form = formDist(rng);
        events.push_back(event);
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const ArrivalEvent& a, const ArrivalEvent& b) {
                         return a.arrivalTime < b.arrivalTime;
                     });
    return events;
}

// -- ArrivalSimulator ---------------------------------------------------------

ArrivalSimulator::ArrivalSimulator(SimulationConfig config, MatchmakingSystem system)
    : config_(std::move(config)), system_(std::move(system)) {}

LineupResult<ArrivalSimulator> ArrivalSimulator::create(SimulationConfig config) {
    auto valid = validate(config);
    if (!valid) {
        return LineupResult<ArrivalSimulator>::err(valid.error());
    }

    auto system = MatchmakingSystem::create(config.matchmaking);
    if (!system) {
        return LineupResult<ArrivalSimulator>::err(system.error());
    }

    return LineupResult<ArrivalSimulator>::ok(
        ArrivalSimulator(std::move(config), std::move(system).value()));
}

SimulationReport ArrivalSimulator::run(const std::vector<ArrivalEvent>& events,
                                       const SimulationObserver& observer) {
    SimulationReport report;
    report.totalPlayers = static_cast<uint32_t>(events.size());

    double totalWait = 0.0;
    for (const auto& event : events) {
        auto id = system_.insert(event.rating, event.form, event.arrivalTime);
        report.finalTime = event.arrivalTime;
        if (observer.onArrival) {
            observer.onArrival(event, id);
        }

        auto match = system_.attemptMatch();
        if (!match) {
            continue;
        }

        totalWait += match->averageWait() * static_cast<double>(lineup::matchmaking::kPlayersPerMatch);
        if (observer.onMatch) {
            observer.onMatch(*match);
        }
        report.matches.push_back(std::move(*match));
    }

    auto stats = system_.stats();
    report.matchesCreated = stats.matchesFormed;
    report.playersMatched = stats.playersMatched;
    report.playersInQueue = stats.queuedPlayers;
    if (report.playersMatched > 0) {
        report.averageWait = totalWait / static_cast<double>(report.playersMatched);
    }

    LogContext ctx;
    ctx.extra["players"] = std::to_string(report.totalPlayers);
    ctx.extra["matches"] = std::to_string(report.matchesCreated);
    ctx.extra["still_queued"] = std::to_string(report.playersInQueue);
    Logger::instance().logWithContext(LogLevel::Info, LogCategory::Simulation,
                                      "Simulation finished", ctx);
    return report;
}

const SimulationConfig& ArrivalSimulator::config() const noexcept {
    return config_;
}

const MatchmakingSystem& ArrivalSimulator::system() const noexcept {
    return system_;
}

LineupResult<SimulationReport> runSimulation(const SimulationConfig& config,
                                             const SimulationObserver& observer) {
    auto simulator = ArrivalSimulator::create(config);
    if (!simulator) {
        return LineupResult<SimulationReport>::err(simulator.error());
    }
    auto events = generateArrivals(config);
    return LineupResult<SimulationReport>::ok(simulator.value().run(events, observer));
}

}  // namespace lineup::simulation
