#pragma once

/// @file rating_summary.hpp
/// @brief End-of-run console summary: totals and the top players by ELO.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "crs/rating/player_registry.hpp"

namespace crs::service {

/// One leaderboard line.
struct SummaryRow {
    std::size_t rank = 0;  ///< 1-based.
    std::string name;
    int32_t elo = 0;
    uint32_t wins = 0;
    uint32_t draws = 0;
    uint32_t losses = 0;
    double scorePercentage = 0.0;
};

/// Snapshot of a registry for console output.
///
/// Usage:
/// @code
///   auto summary = RatingSummary::build(registry, engine.games().size(), 5);
///   std::cout << summary.render();
/// @endcode
struct RatingSummary {
    std::size_t totalPlayers = 0;
    std::size_t totalGames = 0;
    std::vector<SummaryRow> topPlayers;

    /// Rank players by descending ELO (ties keep first-seen order) and keep
    /// the first @p topN.
    [[nodiscard]] static RatingSummary build(const rating::PlayerRegistry& registry,
                                             std::size_t totalGames,
                                             std::size_t topN = 5);

    /// Render as:
    /// @code
    ///   Rating Summary:
    ///   Total players: 2
    ///   Total games: 2
    ///
    ///   Top 5 Players:
    ///   1. Alice: 1231 (2-0-0, 100.0%)
    /// @endcode
    [[nodiscard]] std::string render() const;
};

} // namespace crs::service
