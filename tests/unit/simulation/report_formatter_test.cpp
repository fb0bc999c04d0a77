/// @file report_formatter_test.cpp
/// @brief Unit tests for console narration.

#include <gtest/gtest.h>

#include <string>

#include "lineup/simulation/report_formatter.hpp"

using namespace lineup::simulation;
using namespace lineup::matchmaking;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Match sampleMatch() {
    Match match;
    match.id = MatchId(3);
    match.createdAt = 50.0;
    match.ratingSpan = 80;
    match.balanceScore = 0.4;
    for (uint64_t i = 1; i <= kPlayersPerMatch; ++i) {
        Player p;
        p.id = PlayerId(i);
        p.rating = 1500 + static_cast<int32_t>(i) * 8;
        p.form = static_cast<int32_t>(i) - 5;
        p.joinTime = 40.0;
        (i <= kTeamSize ? match.teamA : match.teamB).players.push_back(p);
    }
    return match;
}

} // namespace

TEST(ReportFormatterTest, BannerListsParameters) {
    SimulationConfig config;
    auto text = formatBanner(config);
    EXPECT_TRUE(contains(text, "Players to simulate: 200"));
    EXPECT_TRUE(contains(text, "Max rating distance: 200"));
    EXPECT_TRUE(contains(text, "Max simulation time: 240.0s"));
    EXPECT_TRUE(contains(text, "Seed: 42"));
}

TEST(ReportFormatterTest, ArrivalLine) {
    auto text = formatArrival({12.5, 1734, -3}, PlayerId(17));
    EXPECT_TRUE(contains(text, "12.50s"));
    EXPECT_TRUE(contains(text, "Player #17"));
    EXPECT_TRUE(contains(text, "rating 1734"));
    EXPECT_TRUE(contains(text, "form -3"));
}

TEST(ReportFormatterTest, MatchAnnouncement) {
    auto text = formatMatch(sampleMatch());
    EXPECT_TRUE(contains(text, "MATCH #3"));
    EXPECT_TRUE(contains(text, "Rating span: 80"));
    EXPECT_TRUE(contains(text, "Balance score: 0.40"));
    EXPECT_TRUE(contains(text, "Avg wait: 10.0s"));
    EXPECT_TRUE(contains(text, "Team A"));
    EXPECT_TRUE(contains(text, "Team B"));
    EXPECT_TRUE(contains(text, "rating 1580"));
}

TEST(ReportFormatterTest, Summary) {
    SimulationReport report;
    report.totalPlayers = 200;
    report.matchesCreated = 12;
    report.playersMatched = 120;
    report.playersInQueue = 80;
    report.finalTime = 239.5;
    report.averageWait = 21.25;

    auto text = formatSummary(report);
    EXPECT_TRUE(contains(text, "SIMULATION SUMMARY"));
    EXPECT_TRUE(contains(text, "Total players: 200"));
    EXPECT_TRUE(contains(text, "Matches created: 12"));
    EXPECT_TRUE(contains(text, "Players matched: 120"));
    EXPECT_TRUE(contains(text, "Players still in queue: 80"));
    EXPECT_TRUE(contains(text, "Average wait of matched players: 21.25s"));
    EXPECT_TRUE(contains(text, "Final simulation time: 239.50s"));
}
