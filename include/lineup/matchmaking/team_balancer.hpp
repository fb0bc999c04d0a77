#pragma once

/// @file team_balancer.hpp
/// @brief Greedy split of 10 players into two teams of 5 by form.

#include <vector>

#include "lineup/matchmaking/matchmaking_types.hpp"

namespace lineup::matchmaking {

/// Static utility splitting a match group into two balanced teams.
///
/// Players are taken in order of form descending (ties by id ascending).
/// Each one joins team A if A has room and either B is full or A's running
/// form sum is not above B's; otherwise team B. This approximates the
/// minimal sum-difference partition. It is deterministic but not optimal.
class TeamBalancer {
public:
    TeamBalancer() = delete;

    /// Split exactly kPlayersPerMatch players into two teams of kTeamSize.
    [[nodiscard]] static BalancedTeams balance(std::vector<Player> players);

    /// Absolute difference of the two teams' average form.
    [[nodiscard]] static double balanceScore(const Team& a, const Team& b) noexcept;
};

}  // namespace lineup::matchmaking
