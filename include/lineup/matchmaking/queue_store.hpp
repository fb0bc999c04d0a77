#pragma once

/// @file queue_store.hpp
/// @brief Waiting-player storage keyed by player id.
///
/// QueueStore owns the set of waiting players and the id counter. It has no
/// matchmaking logic and no locking of its own; MatchmakingSystem serializes
/// every access.

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "lineup/matchmaking/matchmaking_types.hpp"

namespace lineup::matchmaking {

/// Unsynchronized store of waiting players.
///
/// Usage:
/// @code
///   QueueStore store;
///   auto p = store.insert(1500, 3, 12.5);
///   auto waiting = store.snapshot();
///   store.remove({p});
/// @endcode
class QueueStore {
public:
    QueueStore() = default;

    /// Create a player with a fresh id and add it to the waiting set.
    ///
    /// Ids start at 1, increase by one per insert and are never reused.
    Player insert(int32_t rating, int32_t form, double joinTime);

    /// Remove the given players by id.
    ///
    /// Ids that are not present are skipped.
    /// @return The number of players actually removed.
    std::size_t remove(const std::vector<Player>& players);

    [[nodiscard]] bool contains(PlayerId id) const;

    [[nodiscard]] std::optional<Player> find(PlayerId id) const;

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    /// Copy of the waiting set. Order is unspecified.
    [[nodiscard]] std::vector<Player> snapshot() const;

    /// Id handed out by the most recent insert (invalid before the first).
    [[nodiscard]] PlayerId lastAssignedId() const noexcept;

private:
    bool removeOne(PlayerId id);

    std::vector<Player> players_;
    std::unordered_map<PlayerId, std::size_t> index_;
    uint64_t nextId_ = 1;
};

}  // namespace lineup::matchmaking
