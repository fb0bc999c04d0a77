/// @file team_balancer.cpp
/// @brief TeamBalancer implementation.

#include "lineup/matchmaking/team_balancer.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>

namespace lineup::matchmaking {

BalancedTeams TeamBalancer::balance(std::vector<Player> players) {
    assert(players.size() == kPlayersPerMatch && "balance() needs exactly one match worth of players");

    std::sort(players.begin(), players.end(), [](const Player& a, const Player& b) {
        if (a.form != b.form) {
            return a.form > b.form;
        }
        return a.id < b.id;
    });

    BalancedTeams result;
    result.teamA.players.reserve(kTeamSize);
    result.teamB.players.reserve(kTeamSize);

    int32_t sumA = 0;
    int32_t sumB = 0;
    for (const auto& p : players) {
        bool aHasRoom = result.teamA.size() < kTeamSize;
        bool bFull = result.teamB.size() >= kTeamSize;
        if (aHasRoom && (bFull || sumA <= sumB)) {
            result.teamA.players.push_back(p);
            sumA += p.form;
        } else {
            result.teamB.players.push_back(p);
            sumB += p.form;
        }
    }

    result.balanceScore = balanceScore(result.teamA, result.teamB);
    return result;
}

double TeamBalancer::balanceScore(const Team& a, const Team& b) noexcept {
    return std::abs(a.averageForm() - b.averageForm());
}

}  // namespace lineup::matchmaking
