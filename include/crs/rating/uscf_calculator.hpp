#pragma once

/// @file uscf_calculator.hpp
/// @brief USCF-style ELO with a K-factor tiered by games played and rating.

#include <cstdint>

#include "crs/rating/rating_types.hpp"

namespace crs::rating {

/// A player's USCF-style state. @c games counts only games rated by this
/// system and drives the K-factor tier.
struct UscfRating {
    int32_t rating = kInitialRating;
    uint32_t games = 0;
};

class UscfCalculator {
public:
    UscfCalculator() = delete;

    static constexpr uint32_t kProvisionalGames = 20;
    static constexpr int32_t kMasterThreshold = 2100;

    static constexpr int32_t kProvisionalKFactor = 40;
    static constexpr int32_t kRegularKFactor = 32;
    static constexpr int32_t kMasterKFactor = 24;

    /// K-factor for the next game of a player in state @p player:
    /// 40 while provisional (< 20 games), else 32 below 2100, else 24.
    [[nodiscard]] static int32_t kFactor(const UscfRating& player);

    /// New state for @p self after scoring @p score against @p opponent.
    /// Both arguments are pre-game states; the game counter is incremented.
    [[nodiscard]] static UscfRating update(
        const UscfRating& self,
        const UscfRating& opponent,
        double score);
};

} // namespace crs::rating
