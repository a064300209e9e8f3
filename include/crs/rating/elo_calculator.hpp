#pragma once

/// @file elo_calculator.hpp
/// @brief Classic fixed-K ELO rating calculations.
///
/// Uses the standard Elo formula:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
///   delta = round(K * (S - E)), exact halves rounding to even

#include <cstdint>

namespace crs::rating {

/// Rating deltas produced by one game, both computed from pre-game values.
struct EloUpdate {
    int32_t whiteDelta = 0;
    int32_t blackDelta = 0;
};

/// Static utility class for ELO rating calculations.
class EloCalculator {
public:
    EloCalculator() = delete;

    static constexpr int32_t kDefaultKFactor = 32;

    /// Expected score of a player rated @p ratingA against @p ratingB.
    /// @return A value in (0.0, 1.0).
    [[nodiscard]] static double expectedScore(int32_t ratingA, int32_t ratingB);

    /// Signed rating change for one side.
    ///
    /// @param rating          The player's pre-game rating.
    /// @param opponentRating  The opponent's pre-game rating.
    /// @param actualScore     1.0 = win, 0.5 = draw, 0.0 = loss.
    /// @param kFactor         Rating change sensitivity.
    [[nodiscard]] static int32_t ratingDelta(
        int32_t rating,
        int32_t opponentRating,
        double actualScore,
        int32_t kFactor = kDefaultKFactor);

    /// Deltas for both sides of a game. The black score is 1 - whiteScore.
    [[nodiscard]] static EloUpdate update(
        int32_t whiteRating,
        int32_t blackRating,
        double whiteScore,
        int32_t kFactor = kDefaultKFactor);
};

} // namespace crs::rating
