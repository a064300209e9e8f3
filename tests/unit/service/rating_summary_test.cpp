/// @file rating_summary_test.cpp
/// @brief Unit tests for RatingSummary.

#include <gtest/gtest.h>

#include <string>

#include "crs/rating/player_registry.hpp"
#include "crs/rating/rating_engine.hpp"
#include "crs/service/rating_summary.hpp"

using namespace crs::service;
using namespace crs::rating;

TEST(RatingSummaryTest, EmptyRegistry) {
    PlayerRegistry registry;
    auto summary = RatingSummary::build(registry, 0);

    EXPECT_EQ(summary.totalPlayers, 0u);
    EXPECT_TRUE(summary.topPlayers.empty());
    EXPECT_EQ(summary.render(), "Rating Summary:\nTotal players: 0\nTotal games: 0\n");
}

TEST(RatingSummaryTest, RanksByElo) {
    PlayerRegistry registry;
    RatingEngine engine(registry);
    engine.processLog({"Alice - Bob 1-0", "Bob - Alice 0-1"});

    auto summary = RatingSummary::build(registry, engine.games().size());
    ASSERT_EQ(summary.topPlayers.size(), 2u);
    EXPECT_EQ(summary.topPlayers[0].rank, 1u);
    EXPECT_EQ(summary.topPlayers[0].name, "Alice");
    EXPECT_EQ(summary.topPlayers[1].name, "Bob");

    EXPECT_EQ(summary.render(),
              "Rating Summary:\n"
              "Total players: 2\n"
              "Total games: 2\n"
              "\n"
              "Top 2 Players:\n"
              "1. Alice: 1231 (2-0-0, 100.0%)\n"
              "2. Bob: 1169 (0-0-2, 0.0%)\n");
}

TEST(RatingSummaryTest, TiesKeepFirstSeenOrderAndTopNTruncates) {
    PlayerRegistry registry;
    RatingEngine engine(registry);
    engine.processLog({"Carol - Dave 0.5-0.5", "Alice - Bob 0.5-0.5"});

    auto summary = RatingSummary::build(registry, engine.games().size(), 3);
    ASSERT_EQ(summary.topPlayers.size(), 3u);
    EXPECT_EQ(summary.totalPlayers, 4u);
    EXPECT_EQ(summary.topPlayers[0].name, "Carol");
    EXPECT_EQ(summary.topPlayers[1].name, "Dave");
    EXPECT_EQ(summary.topPlayers[2].name, "Alice");
    EXPECT_DOUBLE_EQ(summary.topPlayers[0].scorePercentage, 50.0);
}
