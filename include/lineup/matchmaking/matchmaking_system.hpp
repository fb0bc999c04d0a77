#pragma once

/// @file matchmaking_system.hpp
/// @brief Thread-safe 5v5 matchmaking facade over QueueStore and MatchSelector.
///
/// MatchmakingSystem owns the waiting set, the selector and the match
/// counter. A single mutex covers insert() and the full search+removal
/// cycle of attemptMatch(), so the players removed are always exactly the
/// players the search saw.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "lineup/foundation/lineup_result.hpp"
#include "lineup/matchmaking/matchmaking_types.hpp"

namespace lineup::matchmaking {

/// 5v5 matchmaking queue.
///
/// Usage:
/// @code
///   auto created = MatchmakingSystem::create({.maxRatingDistance = 200});
///   if (!created) { /* invalid config */ }
///   auto mm = std::move(created).value();
///
///   mm.insert(1500, 4, 12.0);
///   if (auto match = mm.attemptMatch()) {
///       // match->teamA / match->teamB, players already dequeued
///   }
/// @endcode
/// Abort the process if a selected group was not fully dequeued.
///
/// A shortfall means the selector saw players the store no longer holds.
/// Logs Critical and flushes before terminating; returns when the counts match.
void requireFullRemoval(std::size_t selected, std::size_t removed);

class MatchmakingSystem {
public:
    /// Validate the configuration and build a system.
    ///
    /// @return InvalidRatingDistance if maxRatingDistance is negative.
    [[nodiscard]] static lineup::foundation::LineupResult<MatchmakingSystem> create(
        MatchmakingConfig config);

    ~MatchmakingSystem();

    MatchmakingSystem(const MatchmakingSystem&) = delete;
    MatchmakingSystem& operator=(const MatchmakingSystem&) = delete;
    MatchmakingSystem(MatchmakingSystem&&) noexcept;
    MatchmakingSystem& operator=(MatchmakingSystem&&) noexcept;

    /// Add a player to the queue. Always succeeds.
    ///
    /// Form outside [kMinForm, kMaxForm] is clamped. joinTime also advances
    /// the queue clock used to stamp matches.
    /// @return The freshly assigned player id.
    PlayerId insert(int32_t rating, int32_t form, double joinTime);

    /// Try to form one match from the current queue.
    ///
    /// @return The match with its players already removed from the queue,
    ///         or nullopt if no eligible group exists.
    [[nodiscard]] std::optional<Match> attemptMatch();

    [[nodiscard]] std::size_t queueSize() const;

    [[nodiscard]] uint64_t matchCount() const;

    [[nodiscard]] bool isQueued(PlayerId id) const;

    /// Copy of the waiting players. Order is unspecified.
    [[nodiscard]] std::vector<Player> snapshot() const;

    [[nodiscard]] MatchmakingStats stats() const;

    [[nodiscard]] const MatchmakingConfig& config() const noexcept;

private:
    explicit MatchmakingSystem(MatchmakingConfig config);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lineup::matchmaking
