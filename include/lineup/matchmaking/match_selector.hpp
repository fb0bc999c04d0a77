#pragma once

/// @file match_selector.hpp
/// @brief Sliding-window search for the best-balanced eligible 10-player group.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "lineup/matchmaking/matchmaking_types.hpp"

namespace lineup::matchmaking {

/// Outcome of a successful search. Nothing has been removed yet.
struct Selection {
    std::vector<Player> players; ///< The 10 chosen players, rating-sorted.
    BalancedTeams teams;
    int64_t ratingSpan = 0;
    std::size_t windowStart = 0; ///< Start index in the rating-sorted order.
};

/// Stateless match search over a snapshot of the waiting set.
///
/// The snapshot is sorted by rating ascending (ties by id ascending). For
/// every start index a window is grown forward while each admitted player
/// stays within maxRatingDistance of the window's first player, stopping at
/// 10. Every full window is balanced with TeamBalancer and the lowest
/// balance score wins; on equal scores the lowest start index is kept.
///
/// Each window costs a sort and a greedy pass, so a search is
/// O(n^2 log n) in the worst case. Live queues are expected to be small.
class MatchSelector {
public:
    /// @param maxRatingDistance Non-negative rating span limit; validated by
    ///        MatchmakingSystem::create().
    explicit MatchSelector(int32_t maxRatingDistance);

    /// Find the best match among the waiting players, if any.
    [[nodiscard]] std::optional<Selection> select(std::vector<Player> waiting) const;

    /// True if the group has exactly kPlayersPerMatch players and a rating
    /// span of at most maxRatingDistance.
    [[nodiscard]] static bool isEligible(const std::vector<Player>& group,
                                         int32_t maxRatingDistance);

    /// max(rating) - min(rating), 0 for an empty group.
    [[nodiscard]] static int64_t ratingSpan(const std::vector<Player>& group) noexcept;

    [[nodiscard]] int32_t maxRatingDistance() const noexcept;

private:
    int32_t maxRatingDistance_;
};

}  // namespace lineup::matchmaking
