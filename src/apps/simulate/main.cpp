/// @file main.cpp
/// @brief lineup_simulate entry point.
///
/// Feeds seeded random arrivals through the 5v5 matchmaking queue and
/// narrates arrivals, matches and a closing summary on stdout.

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>

#include "lineup/app/app_runner.hpp"
#include "lineup/foundation/config_manager.hpp"
#include "lineup/foundation/console_logger.hpp"
#include "lineup/foundation/logger.hpp"
#include "lineup/simulation/arrival_simulator.hpp"
#include "lineup/simulation/report_formatter.hpp"
#include "lineup/simulation/simulation_config.hpp"

namespace {

constexpr const char* kDefaultConfigPath = "/etc/lineup/lineup.yaml";

void applyLogLevel(const lineup::foundation::ConfigManager& config) {
    auto name = config.get<std::string>("logging.level");
    if (!name) {
        return;
    }
    auto level = lineup::foundation::parseLogLevel(name.value());
    if (!level) {
        LINEUP_LOG_WARN(lineup::foundation::LogCategory::Config,
                        "Unknown logging.level '" + name.value() + "', keeping defaults");
        return;
    }
    lineup::foundation::Logger::instance().setAllLevels(*level);
}

} // namespace

int main(int argc, char* argv[]) {
    using lineup::foundation::LogCategory;

    lineup::foundation::ConsoleLogger::installDefault(
        kcenon::common::interfaces::log_level::trace);
    auto& logger = lineup::foundation::Logger::instance();
    // Per-arrival queue logs duplicate the narration below.
    logger.setCategoryLevel(LogCategory::Queue, lineup::foundation::LogLevel::Info);

    auto explicitPath = lineup::app::parseConfigArg(argc, argv);
    auto configPath = explicitPath.empty()
        ? std::filesystem::path(kDefaultConfigPath) : explicitPath;

    lineup::foundation::ConfigManager config;
    auto loadResult = lineup::app::loadConfig(config, configPath);
    if (!loadResult) {
        const char* envPath = std::getenv(lineup::app::kConfigPathEnv);
        bool fromEnv = envPath != nullptr && *envPath != '\0';
        if (!explicitPath.empty() || fromEnv) {
            std::cerr << "Failed to load config: "
                      << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
        LINEUP_LOG_INFO(LogCategory::Config,
                        "No config at " + configPath.string() + ", using defaults");
    }
    applyLogLevel(config);
    lineup::app::applyOptionOverrides(argc, argv, config);

    auto simConfig = lineup::simulation::buildSimulationConfig(config);
    if (!simConfig) {
        std::cerr << "Invalid configuration: " << simConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto cfg = simConfig.value();

    bool printArrivals = config.get<bool>("simulation.print_arrivals").valueOr(true);

    auto simulator = lineup::simulation::ArrivalSimulator::create(cfg);
    if (!simulator) {
        std::cerr << "Failed to start simulation: "
                  << simulator.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << lineup::simulation::formatBanner(cfg);

    lineup::simulation::SimulationObserver observer;
    if (printArrivals) {
        observer.onArrival = [](const lineup::simulation::ArrivalEvent& event,
                                lineup::matchmaking::PlayerId id) {
            std::cout << lineup::simulation::formatArrival(event, id);
        };
    }
    observer.onMatch = [](const lineup::matchmaking::Match& match) {
        std::cout << lineup::simulation::formatMatch(match);
    };

    auto events = lineup::simulation::generateArrivals(cfg);
    auto report = simulator.value().run(events, observer);

    std::cout << lineup::simulation::formatSummary(report);

    auto flushed = logger.flush();
    if (!flushed) {
        std::cerr << "Failed to flush log: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
