#pragma once

/// @file rating_types.hpp
/// @brief Small value types shared by the parser, the algorithms and the engine.

#include <cmath>
#include <cstdint>
#include <string_view>

namespace crs::rating {

/// Starting values for a player seen for the first time.
inline constexpr int32_t kInitialRating = 1200;
inline constexpr double kInitialGlickoDeviation = 350.0;
inline constexpr double kInitialGlickoVolatility = 0.06;

/// Round to the nearest integer, with exact halves going to the even
/// neighbour (16.5 -> 16, 17.5 -> 18, -16.5 -> -16).
inline double roundHalfEven(double value) {
    double rounded = std::round(value);
    if (std::fabs(value - std::trunc(value)) == 0.5) {
        rounded = 2.0 * std::round(value / 2.0);
    }
    return rounded;
}

/// A game's result from one player's point of view.
enum class GameOutcome : uint8_t {
    Win,
    Draw,
    Loss
};

/// Classify a score of 1.0, 0.5 or 0.0.
constexpr GameOutcome outcomeForScore(double score) {
    if (score == 1.0) {
        return GameOutcome::Win;
    }
    if (score == 0.0) {
        return GameOutcome::Loss;
    }
    return GameOutcome::Draw;
}

constexpr std::string_view outcomeName(GameOutcome outcome) {
    switch (outcome) {
        case GameOutcome::Win:  return "Win";
        case GameOutcome::Draw: return "Draw";
        case GameOutcome::Loss: return "Loss";
    }
    return "Unknown";
}

} // namespace crs::rating
