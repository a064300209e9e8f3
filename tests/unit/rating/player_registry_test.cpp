/// @file player_registry_test.cpp
/// @brief Unit tests for Player bookkeeping and PlayerRegistry.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "crs/rating/player.hpp"
#include "crs/rating/player_registry.hpp"

using namespace crs::rating;
using crs::foundation::ErrorCode;

namespace {

NotableResult notable(const std::string& opponent, int32_t gap, uint32_t game) {
    NotableResult entry;
    entry.opponent = opponent;
    entry.ratingGap = gap;
    entry.gameNumber = game;
    return entry;
}

std::vector<uint32_t> gameNumbers(const std::vector<NotableResult>& list) {
    std::vector<uint32_t> numbers;
    for (const auto& entry : list) {
        numbers.push_back(entry.gameNumber);
    }
    return numbers;
}

} // namespace

// ============================================================================
// Player
// ============================================================================

TEST(PlayerTest, StartingValues) {
    Player player("Alice");
    EXPECT_EQ(player.name, "Alice");
    EXPECT_EQ(player.elo, 1200);
    EXPECT_EQ(player.glicko.rating, 1200);
    EXPECT_DOUBLE_EQ(player.glicko.deviation, 350.0);
    EXPECT_DOUBLE_EQ(player.glicko.volatility, 0.06);
    EXPECT_EQ(player.uscf.rating, 1200);
    EXPECT_EQ(player.uscf.games, 0u);
    EXPECT_EQ(player.games, 0u);
    EXPECT_EQ(player.eloExtremes.highest, 1200);
    EXPECT_EQ(player.eloExtremes.lowest, 1200);
    EXPECT_TRUE(player.history.empty());
}

TEST(PlayerTest, CustomInitialEloSeedsExtremes) {
    Player player("Bob", 1500);
    EXPECT_EQ(player.elo, 1500);
    EXPECT_EQ(player.eloExtremes.highest, 1500);
    EXPECT_EQ(player.eloExtremes.lowest, 1500);
    EXPECT_EQ(player.glicko.rating, 1200);
}

TEST(PlayerTest, RecordOutcomeUpdatesTotalsAndTally) {
    Player player("Alice");
    player.recordOutcome("Bob", GameOutcome::Win);
    player.recordOutcome("Bob", GameOutcome::Draw);
    player.recordOutcome("Carol", GameOutcome::Loss);

    EXPECT_EQ(player.games, 3u);
    EXPECT_EQ(player.wins, 1u);
    EXPECT_EQ(player.draws, 1u);
    EXPECT_EQ(player.losses, 1u);

    ASSERT_EQ(player.opponents.size(), 2u);
    const auto& bob = player.opponents.at("Bob");
    EXPECT_EQ(bob.games, 2u);
    EXPECT_EQ(bob.wins, 1u);
    EXPECT_EQ(bob.draws, 1u);
    EXPECT_EQ(bob.losses, 0u);
    EXPECT_EQ(player.opponents.at("Carol").losses, 1u);
}

TEST(PlayerTest, ObserveRatingsTracksEachSystem) {
    Player player("Alice");
    player.elo = 1250;
    player.glicko.rating = 1100;
    player.uscf.rating = 1300;
    player.observeRatings();
    player.elo = 1190;
    player.observeRatings();

    EXPECT_EQ(player.eloExtremes.highest, 1250);
    EXPECT_EQ(player.eloExtremes.lowest, 1190);
    EXPECT_EQ(player.glickoExtremes.highest, 1200);
    EXPECT_EQ(player.glickoExtremes.lowest, 1100);
    EXPECT_EQ(player.uscfExtremes.highest, 1300);
    EXPECT_EQ(player.uscfExtremes.lowest, 1200);
}

TEST(PlayerTest, ScorePercentage) {
    Player player("Alice");
    EXPECT_DOUBLE_EQ(player.scorePercentage(), 0.0);
    player.recordOutcome("Bob", GameOutcome::Win);
    player.recordOutcome("Bob", GameOutcome::Draw);
    EXPECT_DOUBLE_EQ(player.scorePercentage(), 75.0);
}

// ============================================================================
// Notable result lists
// ============================================================================

TEST(NotableResultTest, SortedDescendingAndTruncated) {
    std::vector<NotableResult> list;
    const int32_t gaps[] = {10, 50, 30, 70, 20, 60, 40};
    uint32_t game = 0;
    for (int32_t gap : gaps) {
        recordNotableResult(list, notable("X", gap, ++game));
    }

    ASSERT_EQ(list.size(), 5u);
    EXPECT_EQ(list[0].ratingGap, 70);
    EXPECT_EQ(list[1].ratingGap, 60);
    EXPECT_EQ(list[2].ratingGap, 50);
    EXPECT_EQ(list[3].ratingGap, 40);
    EXPECT_EQ(list[4].ratingGap, 30);
}

TEST(NotableResultTest, EqualGapsKeepInsertionOrder) {
    std::vector<NotableResult> list;
    recordNotableResult(list, notable("A", 40, 1));
    recordNotableResult(list, notable("B", 40, 2));
    recordNotableResult(list, notable("C", 90, 3));
    recordNotableResult(list, notable("D", 40, 4));

    EXPECT_EQ(gameNumbers(list), (std::vector<uint32_t>{3, 1, 2, 4}));
}

TEST(NotableResultTest, TiesAtTheCutoffDropTheNewest) {
    std::vector<NotableResult> list;
    for (uint32_t game = 1; game <= 6; ++game) {
        recordNotableResult(list, notable("X", 25, game));
    }
    EXPECT_EQ(gameNumbers(list), (std::vector<uint32_t>{1, 2, 3, 4, 5}));
}

TEST(NotableResultTest, InsertionOrderDoesNotChangeDistinctTopFive) {
    const int32_t gaps[] = {15, 80, 35, 5, 60, 95, 45};

    std::vector<NotableResult> forward;
    for (int32_t gap : gaps) {
        recordNotableResult(forward, notable("X", gap, static_cast<uint32_t>(gap)));
    }
    std::vector<NotableResult> backward;
    for (auto it = std::rbegin(gaps); it != std::rend(gaps); ++it) {
        recordNotableResult(backward, notable("X", *it, static_cast<uint32_t>(*it)));
    }

    EXPECT_EQ(gameNumbers(forward), gameNumbers(backward));
    EXPECT_EQ(gameNumbers(forward), (std::vector<uint32_t>{95, 80, 60, 45, 35}));
}

TEST(NotableResultTest, CustomLimit) {
    std::vector<NotableResult> list;
    for (uint32_t game = 1; game <= 4; ++game) {
        recordNotableResult(list, notable("X", static_cast<int32_t>(game), game), 2);
    }
    EXPECT_EQ(gameNumbers(list), (std::vector<uint32_t>{4, 3}));
}

// ============================================================================
// PlayerRegistry
// ============================================================================

TEST(PlayerRegistryTest, EnsureCreatesOnce) {
    PlayerRegistry registry;
    auto& first = registry.ensure("Alice");
    first.elo = 1300;
    auto& again = registry.ensure("Alice");

    EXPECT_EQ(&first, &again);
    EXPECT_EQ(again.elo, 1300);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(PlayerRegistryTest, NamesAreCaseSensitive) {
    PlayerRegistry registry;
    registry.ensure("alice");
    registry.ensure("Alice");
    EXPECT_EQ(registry.size(), 2u);
}

TEST(PlayerRegistryTest, NamesAreTrimmed) {
    PlayerRegistry registry;
    registry.ensure("  Alice ");
    EXPECT_TRUE(registry.contains("Alice"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.names().front(), "Alice");
}

TEST(PlayerRegistryTest, NamesInFirstSeenOrder) {
    PlayerRegistry registry;
    registry.ensure("Carol");
    registry.ensure("Alice");
    registry.ensure("Carol");
    registry.ensure("Bob");
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"Carol", "Alice", "Bob"}));
}

TEST(PlayerRegistryTest, ReferencesSurviveGrowth) {
    PlayerRegistry registry;
    auto& alice = registry.ensure("Alice");
    for (int i = 0; i < 1000; ++i) {
        registry.ensure("Player " + std::to_string(i));
    }
    alice.elo = 1400;
    EXPECT_EQ(registry.find("Alice")->elo, 1400);
}

TEST(PlayerRegistryTest, FindAndGetUnknown) {
    PlayerRegistry registry;
    EXPECT_EQ(registry.find("Nobody"), nullptr);

    auto result = registry.get("Nobody");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PlayerNotFound);
}

TEST(PlayerRegistryTest, GetKnown) {
    PlayerRegistry registry(1500);
    registry.ensure("Alice");
    auto result = registry.get("Alice");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().get().elo, 1500);
    EXPECT_EQ(registry.initialElo(), 1500);
}
