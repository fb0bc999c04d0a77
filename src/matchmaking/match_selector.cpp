/// @file match_selector.cpp
/// @brief MatchSelector implementation.

#include "lineup/matchmaking/match_selector.hpp"

#include "lineup/matchmaking/team_balancer.hpp"

#include <algorithm>

namespace lineup::matchmaking {

MatchSelector::MatchSelector(int32_t maxRatingDistance)
    : maxRatingDistance_(maxRatingDistance) {}

std::optional<Selection> MatchSelector::select(std::vector<Player> waiting) const {
    if (waiting.size() < kPlayersPerMatch) {
        return std::nullopt;
    }

    std::sort(waiting.begin(), waiting.end(), [](const Player& a, const Player& b) {
        if (a.rating != b.rating) {
            return a.rating < b.rating;
        }
        return a.id < b.id;
    });

    std::optional<Selection> best;

    for (std::size_t start = 0; start + kPlayersPerMatch <= waiting.size(); ++start) {
        const auto& anchor = waiting[start];

        std::vector<Player> window;
        window.reserve(kPlayersPerMatch);
        for (std::size_t i = start; i < waiting.size() && window.size() < kPlayersPerMatch; ++i) {
            // Sorted input: once one player is out of range, all later ones are.
            if (static_cast<int64_t>(waiting[i].rating) - anchor.rating > maxRatingDistance_) {
                break;
            }
            window.push_back(waiting[i]);
        }

        if (!isEligible(window, maxRatingDistance_)) {
            continue;
        }

        auto teams = TeamBalancer::balance(window);
        if (best && teams.balanceScore >= best->teams.balanceScore) {
            continue;
        }

        Selection candidate;
        candidate.ratingSpan = ratingSpan(window);
        candidate.players = std::move(window);
        candidate.teams = std::move(teams);
        candidate.windowStart = start;
        best = std::move(candidate);
    }

    return best;
}

bool MatchSelector::isEligible(const std::vector<Player>& group, int32_t maxRatingDistance) {
    return group.size() == kPlayersPerMatch && ratingSpan(group) <= maxRatingDistance;
}

int64_t MatchSelector::ratingSpan(const std::vector<Player>& group) noexcept {
    if (group.empty()) {
        return 0;
    }
    auto [lo, hi] = std::minmax_element(group.begin(), group.end(),
                                        [](const Player& a, const Player& b) {
                                            return a.rating < b.rating;
                                        });
    return static_cast<int64_t>(hi->rating) - lo->rating;
}

int32_t MatchSelector::maxRatingDistance() const noexcept {
    return maxRatingDistance_;
}

}  // namespace lineup::matchmaking
