/// @file report_formatter.cpp
/// @brief Console narration for simulation runs.

#include "lineup/simulation/report_formatter.hpp"

#include <iomanip>
#include <sstream>

namespace lineup::simulation {

using lineup::matchmaking::Match;
using lineup::matchmaking::PlayerId;
using lineup::matchmaking::Team;

namespace {

constexpr int kRuleWidth = 70;

std::string rule(char c = '=') {
    return std::string(kRuleWidth, c) + "\n";
}

void writeTeam(std::ostringstream& oss, const char* label, const Team& team,
               double createdAt) {
    oss << "  " << label << " (avg rating " << std::setprecision(1)
        << team.averageRating() << ", avg form " << std::setprecision(2)
        << team.averageForm() << "):\n";
    for (const auto& p : team.players) {
        oss << "    #" << std::setw(4) << std::left << p.id.value() << std::right
            << " rating " << std::setw(4) << p.rating
            << "  form " << std::showpos << std::setw(3) << p.form << std::noshowpos
            << "  waited " << std::setprecision(1) << (createdAt - p.joinTime) << "s\n";
    }
}

} // namespace

std::string formatBanner(const SimulationConfig& config) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << rule();
    oss << "5V5 MATCHMAKING SIMULATION\n";
    oss << rule();
    oss << "Players to simulate: " << config.numPlayers << "\n";
    oss << "Max rating distance: " << config.matchmaking.maxRatingDistance << "\n";
    oss << "Max simulation time: " << config.maxTime << "s\n";
    if (config.seed) {
        oss << "Seed: " << *config.seed << "\n";
    }
    oss << rule();
    return oss.str();
}

std::string formatArrival(const ArrivalEvent& event, PlayerId id) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "[" << std::setw(7) << event.arrivalTime << "s] Player #" << id.value()
        << " joined (rating " << event.rating << ", form " << std::showpos
        << event.form << std::noshowpos << ")\n";
    return oss.str();
}

std::string formatMatch(const Match& match) {
    std::ostringstream oss;
    oss << std::fixed;
    oss << "\n" << rule('-');
    oss << "MATCH #" << match.id.value() << " created at " << std::setprecision(2)
        << match.createdAt << "s\n";
    oss << "  Rating span: " << match.ratingSpan << "  Balance score: "
        << std::setprecision(2) << match.balanceScore << "  Avg wait: "
        << std::setprecision(1) << match.averageWait() << "s\n";
    writeTeam(oss, "Team A", match.teamA, match.createdAt);
    writeTeam(oss, "Team B", match.teamB, match.createdAt);
    oss << rule('-');
    return oss.str();
}

std::string formatSummary(const SimulationReport& report) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "\n" << rule();
    oss << "SIMULATION SUMMARY\n";
    oss << rule();
    oss << "Total players: " << report.totalPlayers << "\n";
    oss << "Matches created: " << report.matchesCreated << "\n";
    oss << "Players matched: " << report.playersMatched << "\n";
    oss << "Players still in queue: " << report.playersInQueue << "\n";
    oss << "Average wait of matched players: " << report.averageWait << "s\n";
    oss << "Final simulation time: " << report.finalTime << "s\n";
    oss << rule();
    return oss.str();
}

}  // namespace lineup::simulation
