/// @file matchmaking_system_test.cpp
/// @brief Unit tests for the MatchmakingSystem facade.

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "lineup/foundation/error_code.hpp"
#include "lineup/matchmaking/matchmaking_system.hpp"
#include "support/mock_logger.hpp"

using namespace lineup::matchmaking;
using lineup::foundation::ErrorCode;

class MatchmakingSystemTest : public ::testing::Test {
protected:
    static MatchmakingSystem make(int32_t maxRatingDistance) {
        MatchmakingConfig config;
        config.maxRatingDistance = maxRatingDistance;
        auto created = MatchmakingSystem::create(config);
        EXPECT_TRUE(created.hasValue());
        return std::move(created).value();
    }

    static void expectValidMatch(const Match& match, int32_t maxRatingDistance) {
        ASSERT_EQ(match.teamA.size(), kTeamSize);
        ASSERT_EQ(match.teamB.size(), kTeamSize);

        std::set<PlayerId> ids;
        int32_t lo = match.teamA.players.front().rating;
        int32_t hi = lo;
        for (const auto& p : match.players()) {
            ids.insert(p.id);
            lo = std::min(lo, p.rating);
            hi = std::max(hi, p.rating);
        }
        EXPECT_EQ(ids.size(), kPlayersPerMatch) << "teams overlap";
        EXPECT_LE(hi - lo, maxRatingDistance);
        EXPECT_EQ(match.ratingSpan, hi - lo);
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(MatchmakingSystemTest, NegativeDistanceRejected) {
    MatchmakingConfig config;
    config.maxRatingDistance = -1;
    auto created = MatchmakingSystem::create(config);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::InvalidRatingDistance);
}

TEST_F(MatchmakingSystemTest, ZeroDistanceAccepted) {
    MatchmakingConfig config;
    config.maxRatingDistance = 0;
    EXPECT_TRUE(MatchmakingSystem::create(config).hasValue());
}

TEST_F(MatchmakingSystemTest, DefaultConfig) {
    MatchmakingConfig config;
    EXPECT_EQ(config.maxRatingDistance, 200);
}

TEST_F(MatchmakingSystemTest, InitialState) {
    auto mm = make(200);
    EXPECT_EQ(mm.queueSize(), 0u);
    EXPECT_EQ(mm.matchCount(), 0u);
    EXPECT_EQ(mm.config().maxRatingDistance, 200);
    EXPECT_FALSE(mm.attemptMatch().has_value());
}

// ============================================================================
// Insert
// ============================================================================

TEST_F(MatchmakingSystemTest, InsertReturnsSequentialIds) {
    auto mm = make(200);
    EXPECT_EQ(mm.insert(1500, 0, 0.0), PlayerId(1));
    EXPECT_EQ(mm.insert(1500, 0, 1.0), PlayerId(2));
    EXPECT_EQ(mm.queueSize(), 2u);
    EXPECT_TRUE(mm.isQueued(PlayerId(1)));
}

TEST_F(MatchmakingSystemTest, FormIsClampedAndWarned) {
    lineup::test::ScopedMockLogger mock;
    auto mm = make(200);

    auto high = mm.insert(1500, 14, 0.0);
    auto low = mm.insert(1500, -30, 0.0);

    auto snap = mm.snapshot();
    for (const auto& p : snap) {
        if (p.id == high) {
            EXPECT_EQ(p.form, kMaxForm);
        }
        if (p.id == low) {
            EXPECT_EQ(p.form, kMinForm);
        }
    }
    EXPECT_EQ(mock->matching("Form out of range").size(), 2u);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(MatchmakingSystemTest, NineEvenlySpacedPlayersNoMatch) {
    auto mm = make(200);
    for (int i = 0; i < 9; ++i) {
        mm.insert(1000 + 100 * i, 0, i);
    }
    EXPECT_FALSE(mm.attemptMatch().has_value());
    EXPECT_EQ(mm.queueSize(), 9u);
    EXPECT_EQ(mm.matchCount(), 0u);
}

TEST_F(MatchmakingSystemTest, OpposedFormsUseGreedySplit) {
    auto mm = make(100);
    const int32_t forms[] = {5, 5, 5, 5, 5, -5, -5, -5, -5, -5};
    for (int i = 0; i < 10; ++i) {
        mm.insert(1000 + 10 * i, forms[i], i);
    }

    auto match = mm.attemptMatch();
    ASSERT_TRUE(match.has_value());
    expectValidMatch(*match, 100);
    EXPECT_EQ(match->teamA.formSum(), 5);
    EXPECT_EQ(match->teamB.formSum(), -5);
    EXPECT_DOUBLE_EQ(match->balanceScore, 2.0);
    EXPECT_EQ(mm.queueSize(), 0u);
    EXPECT_EQ(mm.matchCount(), 1u);
}

TEST_F(MatchmakingSystemTest, TwoRatingClustersTooFarApart) {
    auto mm = make(200);
    for (int i = 0; i < 5; ++i) {
        mm.insert(1000, 0, i);
    }
    for (int i = 0; i < 5; ++i) {
        mm.insert(1300, 0, 5 + i);
    }
    EXPECT_EQ(mm.queueSize(), 10u);
    EXPECT_FALSE(mm.attemptMatch().has_value());
    EXPECT_EQ(mm.queueSize(), 10u);
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(MatchmakingSystemTest, MatchedPlayersLeaveQueue) {
    auto mm = make(300);
    for (int i = 0; i < 13; ++i) {
        mm.insert(1500 + 20 * i, (i % 7) - 3, i);
    }

    auto match = mm.attemptMatch();
    ASSERT_TRUE(match.has_value());
    expectValidMatch(*match, 300);
    EXPECT_EQ(mm.queueSize(), 3u);

    auto snap = mm.snapshot();
    for (const auto& p : match->players()) {
        EXPECT_FALSE(mm.isQueued(p.id));
        EXPECT_EQ(std::count(snap.begin(), snap.end(), p), 0);
    }

    EXPECT_FALSE(mm.attemptMatch().has_value());
}

TEST_F(MatchmakingSystemTest, MatchIdsFollowCounter) {
    auto mm = make(0);
    for (int i = 0; i < 20; ++i) {
        mm.insert(1500, 0, i);
    }
    auto first = mm.attemptMatch();
    auto second = mm.attemptMatch();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->id, MatchId(1));
    EXPECT_EQ(second->id, MatchId(2));
    EXPECT_EQ(mm.matchCount(), 2u);
    EXPECT_EQ(mm.queueSize(), 0u);
}

TEST_F(MatchmakingSystemTest, IdenticalInsertsGiveIdenticalMatches) {
    auto run = [] {
        auto mm = make(150);
        std::vector<Match> matches;
        for (int i = 0; i < 120; ++i) {
            mm.insert(1000 + (i * 131) % 1500, (i * 13) % 21 - 10, i * 0.5);
            if (auto m = mm.attemptMatch()) {
                matches.push_back(*m);
            }
        }
        return matches;
    };

    auto a = run();
    auto b = run();
    ASSERT_EQ(a.size(), b.size());
    ASSERT_FALSE(a.empty());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].id, b[i].id);
        EXPECT_DOUBLE_EQ(a[i].balanceScore, b[i].balanceScore);
        ASSERT_EQ(a[i].teamA.size(), b[i].teamA.size());
        for (std::size_t j = 0; j < a[i].teamA.size(); ++j) {
            EXPECT_EQ(a[i].teamA.players[j].id, b[i].teamA.players[j].id);
            EXPECT_EQ(a[i].teamB.players[j].id, b[i].teamB.players[j].id);
        }
    }
}

TEST_F(MatchmakingSystemTest, EveryMatchInLongRunIsValid) {
    auto mm = make(200);
    std::set<PlayerId> everMatched;
    for (int i = 0; i < 300; ++i) {
        mm.insert(1000 + (i * 389) % 2000, (i * 11) % 21 - 10, i);
        if (auto m = mm.attemptMatch()) {
            expectValidMatch(*m, 200);
            for (const auto& p : m->players()) {
                EXPECT_TRUE(everMatched.insert(p.id).second) << "matched twice";
            }
        }
    }
    auto stats = mm.stats();
    EXPECT_EQ(stats.playersInserted, 300u);
    EXPECT_EQ(stats.matchAttempts, 300u);
    EXPECT_EQ(stats.playersMatched, stats.matchesFormed * kPlayersPerMatch);
    EXPECT_EQ(stats.queuedPlayers + stats.playersMatched, 300u);
    EXPECT_EQ(everMatched.size(), stats.playersMatched);
}

TEST_F(MatchmakingSystemTest, MatchStampedWithQueueClock) {
    auto mm = make(1000);
    for (int i = 0; i < 10; ++i) {
        mm.insert(1500, 0, 10.0 * i);
    }
    auto match = mm.attemptMatch();
    ASSERT_TRUE(match.has_value());
    EXPECT_DOUBLE_EQ(match->createdAt, 90.0);
    // Waits are 90, 80, ..., 0.
    EXPECT_DOUBLE_EQ(match->averageWait(), 45.0);
    EXPECT_DOUBLE_EQ(mm.stats().clock, 90.0);
}

TEST_F(MatchmakingSystemTest, MatchFormedIsLogged) {
    lineup::test::ScopedMockLogger mock;
    auto mm = make(0);
    for (int i = 0; i < 10; ++i) {
        mm.insert(1500, 0, i);
    }
    ASSERT_TRUE(mm.attemptMatch().has_value());

    auto records = mock->matching("Match formed");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, kcenon::common::interfaces::log_level::info);
    EXPECT_NE(records[0].message.find("match_id=1"), std::string::npos);
    EXPECT_NE(records[0].message.find("balance=0.00"), std::string::npos);
    EXPECT_NE(records[0].message.find("rating_span=0"), std::string::npos);
}

TEST_F(MatchmakingSystemTest, MoveKeepsQueue) {
    auto mm = make(200);
    mm.insert(1500, 0, 0.0);
    MatchmakingSystem moved(std::move(mm));
    EXPECT_EQ(moved.queueSize(), 1u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(MatchmakingSystemTest, ConcurrentInsertAndMatchKeepExclusivity) {
    auto mm = make(250);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;

    std::mutex collectedMutex;
    std::vector<Match> collected;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                int n = t * kPerThread + i;
                mm.insert(1000 + (n * 97) % 1200, n % 21 - 10, n);
                if (auto m = mm.attemptMatch()) {
                    std::lock_guard lock(collectedMutex);
                    collected.push_back(std::move(*m));
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<PlayerId> seen;
    for (const auto& m : collected) {
        expectValidMatch(m, 250);
        for (const auto& p : m.players()) {
            EXPECT_TRUE(seen.insert(p.id).second);
            EXPECT_FALSE(mm.isQueued(p.id));
        }
    }
    EXPECT_EQ(mm.matchCount(), collected.size());
    EXPECT_EQ(mm.queueSize() + seen.size(),
              static_cast<std::size_t>(kThreads * kPerThread));
}

// ============================================================================
// Removal consistency
// ============================================================================

TEST(MatchmakingSystemDeathTest, ShortRemovalAborts) {
    EXPECT_DEATH(requireFullRemoval(kPlayersPerMatch, kPlayersPerMatch - 1), "");
}

TEST(MatchmakingSystemDeathTest, FullRemovalReturns) {
    requireFullRemoval(kPlayersPerMatch, kPlayersPerMatch);
    SUCCEED();
}
