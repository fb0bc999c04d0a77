#pragma once

/// @file matchmaking_types.hpp
/// @brief Core types for 5v5 matchmaking: players, teams, matches, config.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lineup/foundation/types.hpp"

namespace lineup::matchmaking {

using lineup::foundation::MatchId;
using lineup::foundation::PlayerId;

/// Players per team.
inline constexpr std::size_t kTeamSize = 5;

/// Players per match (two full teams).
inline constexpr std::size_t kPlayersPerMatch = 2 * kTeamSize;

/// Bounds of the form signal (net wins over the last 10 matches).
inline constexpr int32_t kMinForm = -10;
inline constexpr int32_t kMaxForm = 10;

/// A waiting player. Created by the queue store and never modified.
///
/// Identity is the id alone: two players with equal rating and form but
/// different ids are distinct.
struct Player {
    PlayerId id;
    int32_t rating = 0;
    int32_t form = 0;      ///< Net wins over the last 10 matches, [-10, +10].
    double joinTime = 0.0; ///< Queue entry time in seconds; reporting only.

    friend bool operator==(const Player& a, const Player& b) noexcept {
        return a.id == b.id;
    }
};

/// One side of a match.
struct Team {
    std::vector<Player> players;

    [[nodiscard]] std::size_t size() const noexcept { return players.size(); }

    [[nodiscard]] int32_t formSum() const noexcept;

    /// Mean form, 0.0 for an empty team.
    [[nodiscard]] double averageForm() const noexcept;

    /// Mean rating, 0.0 for an empty team.
    [[nodiscard]] double averageRating() const noexcept;

    [[nodiscard]] bool contains(PlayerId id) const noexcept;
};

/// Two teams produced by the balancer together with their balance score.
struct BalancedTeams {
    Team teamA;
    Team teamB;
    double balanceScore = 0.0; ///< |avgForm(A) - avgForm(B)|, lower is better.
};

/// A formed match. Transient: it is reported once and not stored.
struct Match {
    MatchId id;
    Team teamA;
    Team teamB;
    double balanceScore = 0.0;
    int64_t ratingSpan = 0;  ///< max(rating) - min(rating) over all 10.
    double createdAt = 0.0;  ///< Queue clock (latest join time) at formation.

    /// All 10 players, team A first.
    [[nodiscard]] std::vector<Player> players() const;

    /// Mean of createdAt - joinTime over all 10 players.
    [[nodiscard]] double averageWait() const noexcept;
};

/// Matchmaking configuration.
struct MatchmakingConfig {
    /// Largest allowed max(rating) - min(rating) inside one match.
    /// Must be non-negative; 0 only admits exact-rating groups.
    int32_t maxRatingDistance = 200;
};

/// Runtime counters for a matchmaking system.
struct MatchmakingStats {
    std::size_t queuedPlayers = 0;
    uint64_t playersInserted = 0;
    uint64_t matchAttempts = 0;
    uint64_t matchesFormed = 0;
    uint64_t playersMatched = 0;
    double clock = 0.0; ///< Latest join time seen.
};

}  // namespace lineup::matchmaking
