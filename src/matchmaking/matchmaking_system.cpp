/// @file matchmaking_system.cpp
/// @brief MatchmakingSystem implementation.

#include "lineup/matchmaking/matchmaking_system.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

#include "lineup/foundation/error_code.hpp"
#include "lineup/foundation/lineup_error.hpp"
#include "lineup/foundation/logger.hpp"
#include "lineup/matchmaking/match_selector.hpp"
#include "lineup/matchmaking/queue_store.hpp"

namespace lineup::matchmaking {

using lineup::foundation::ErrorCode;
using lineup::foundation::LineupError;
using lineup::foundation::LineupResult;
using lineup::foundation::LogCategory;
using lineup::foundation::LogContext;
using lineup::foundation::LogLevel;
using lineup::foundation::Logger;

namespace {

std::string formatScore(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

}  // namespace

void requireFullRemoval(std::size_t selected, std::size_t removed) {
    if (removed == selected) {
        return;
    }
    LogContext ctx;
    ctx.extra["selected"] = std::to_string(selected);
    ctx.extra["removed"] = std::to_string(removed);
    Logger::instance().logWithContext(LogLevel::Critical, LogCategory::Matchmaking,
                                      "Selected players missing from queue", ctx);
    (void)Logger::instance().flush();
    std::abort();
}

// -- Impl ---------------------------------------------------------------------

struct MatchmakingSystem::Impl {
    MatchmakingConfig config;
    MatchSelector selector;

    mutable std::mutex mutex;
    QueueStore store;
    MatchmakingStats stats;

    explicit Impl(MatchmakingConfig cfg)
        : config(cfg)
        , selector(cfg.maxRatingDistance) {}
};

// -- Construction / destruction / move ----------------------------------------

LineupResult<MatchmakingSystem> MatchmakingSystem::create(MatchmakingConfig config) {
    if (config.maxRatingDistance < 0) {
        return LineupResult<MatchmakingSystem>::err(
            LineupError(ErrorCode::InvalidRatingDistance,
                        "maxRatingDistance must be non-negative, got " +
                            std::to_string(config.maxRatingDistance)));
    }

    LogContext ctx;
    ctx.extra["max_rating_distance"] = std::to_string(config.maxRatingDistance);
    Logger::instance().logWithContext(LogLevel::Debug, LogCategory::Matchmaking,
                                      "Matchmaking system created", ctx);

    return LineupResult<MatchmakingSystem>::ok(MatchmakingSystem(config));
}

MatchmakingSystem::MatchmakingSystem(MatchmakingConfig config)
    : impl_(std::make_unique<Impl>(config)) {}

MatchmakingSystem::~MatchmakingSystem() = default;

MatchmakingSystem::MatchmakingSystem(MatchmakingSystem&&) noexcept = default;
MatchmakingSystem& MatchmakingSystem::operator=(MatchmakingSystem&&) noexcept = default;

// -- Queue operations ---------------------------------------------------------

PlayerId MatchmakingSystem::insert(int32_t rating, int32_t form, double joinTime) {
    int32_t clamped = std::clamp(form, kMinForm, kMaxForm);

    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto player = impl_->store.insert(rating, clamped, joinTime);
    impl_->stats.playersInserted++;
    impl_->stats.clock = std::max(impl_->stats.clock, joinTime);

    auto& logger = Logger::instance();
    if (clamped != form) {
        LogContext ctx;
        ctx.playerId = player.id;
        ctx.extra["form"] = std::to_string(form);
        ctx.extra["clamped"] = std::to_string(clamped);
        logger.logWithContext(LogLevel::Warning, LogCategory::Queue,
                              "Form out of range, clamped", ctx);
    }
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Queue)) {
        LogContext ctx;
        ctx.playerId = player.id;
        ctx.extra["rating"] = std::to_string(rating);
        ctx.extra["form"] = std::to_string(clamped);
        ctx.extra["queue_size"] = std::to_string(impl_->store.size());
        logger.logWithContext(LogLevel::Debug, LogCategory::Queue,
                              "Player joined queue", ctx);
    }

    return player.id;
}

std::optional<Match> MatchmakingSystem::attemptMatch() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stats.matchAttempts++;

    auto selection = impl_->selector.select(impl_->store.snapshot());
    if (!selection) {
        return std::nullopt;
    }

    std::size_t removed = impl_->store.remove(selection->players);
    requireFullRemoval(selection->players.size(), removed);

    impl_->stats.matchesFormed++;
    impl_->stats.playersMatched += removed;

    Match match;
    match.id = MatchId(impl_->stats.matchesFormed);
    match.teamA = std::move(selection->teams.teamA);
    match.teamB = std::move(selection->teams.teamB);
    match.balanceScore = selection->teams.balanceScore;
    match.ratingSpan = selection->ratingSpan;
    match.createdAt = impl_->stats.clock;

    LogContext ctx;
    ctx.matchId = match.id;
    ctx.extra["rating_span"] = std::to_string(match.ratingSpan);
    ctx.extra["balance"] = formatScore(match.balanceScore);
    ctx.extra["queue_size"] = std::to_string(impl_->store.size());
    Logger::instance().logWithContext(LogLevel::Info, LogCategory::Matchmaking,
                                      "Match formed", ctx);

    return match;
}

// -- Introspection ------------------------------------------------------------

std::size_t MatchmakingSystem::queueSize() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->store.size();
}

uint64_t MatchmakingSystem::matchCount() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->stats.matchesFormed;
}

bool MatchmakingSystem::isQueued(PlayerId id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->store.contains(id);
}

std::vector<Player> MatchmakingSystem::snapshot() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->store.snapshot();
}

MatchmakingStats MatchmakingSystem::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto result = impl_->stats;
    result.queuedPlayers = impl_->store.size();
    return result;
}

const MatchmakingConfig& MatchmakingSystem::config() const noexcept {
    return impl_->config;
}

}  // namespace lineup::matchmaking
