/// @file matchmaking_types.cpp
/// @brief Derived values for Team and Match.

#include "lineup/matchmaking/matchmaking_types.hpp"

#include <algorithm>
#include <numeric>

namespace lineup::matchmaking {

int32_t Team::formSum() const noexcept {
    return std::accumulate(players.begin(), players.end(), int32_t{0},
                           [](int32_t acc, const Player& p) { return acc + p.form; });
}

double Team::averageForm() const noexcept {
    if (players.empty()) {
        return 0.0;
    }
    return static_cast<double>(formSum()) / static_cast<double>(players.size());
}

double Team::averageRating() const noexcept {
    if (players.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& p : players) {
        sum += static_cast<double>(p.rating);
    }
    return sum / static_cast<double>(players.size());
}

bool Team::contains(PlayerId id) const noexcept {
    return std::any_of(players.begin(), players.end(),
                       [id](const Player& p) { return p.id == id; });
}

std::vector<Player> Match::players() const {
    std::vector<Player> all;
    all.reserve(teamA.size() + teamB.size());
    all.insert(all.end(), teamA.players.begin(), teamA.players.end());
    all.insert(all.end(), teamB.players.begin(), teamB.players.end());
    return all;
}

double Match::averageWait() const noexcept {
    std::size_t count = teamA.size() + teamB.size();
    if (count == 0) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto* team : {&teamA, &teamB}) {
        for (const auto& p : team->players) {
            total += createdAt - p.joinTime;
        }
    }
    return total / static_cast<double>(count);
}

}  // namespace lineup::matchmaking
