/// @file queue_store.cpp
/// @brief QueueStore implementation.

#include "lineup/matchmaking/queue_store.hpp"

#include <utility>

namespace lineup::matchmaking {

Player QueueStore::insert(int32_t rating, int32_t form, double joinTime) {
    Player player;
    player.id = PlayerId(nextId_++);
    player.rating = rating;
    player.form = form;
    player.joinTime = joinTime;

    index_[player.id] = players_.size();
    players_.push_back(player);
    return player;
}

std::size_t QueueStore::remove(const std::vector<Player>& players) {
    std::size_t removed = 0;
    for (const auto& p : players) {
        if (removeOne(p.id)) {
            ++removed;
        }
    }
    return removed;
}

bool QueueStore::removeOne(PlayerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }

    auto idx = it->second;
    auto lastIdx = players_.size() - 1;

    // Swap with last element for O(1) removal.
    if (idx != lastIdx) {
        std::swap(players_[idx], players_[lastIdx]);
        index_[players_[idx].id] = idx;
    }

    players_.pop_back();
    index_.erase(it);
    return true;
}

bool QueueStore::contains(PlayerId id) const {
    return index_.count(id) > 0;
}

std::optional<Player> QueueStore::find(PlayerId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return players_[it->second];
}

std::size_t QueueStore::size() const noexcept {
    return players_.size();
}

bool QueueStore::empty() const noexcept {
    return players_.empty();
}

std::vector<Player> QueueStore::snapshot() const {
    return players_;
}

PlayerId QueueStore::lastAssignedId() const noexcept {
    return PlayerId(nextId_ - 1);
}

}  // namespace lineup::matchmaking
