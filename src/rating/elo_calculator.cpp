/// @file elo_calculator.cpp
/// @brief EloCalculator implementation.

#include "crs/rating/elo_calculator.hpp"

#include <cmath>

#include "crs/rating/rating_types.hpp"

namespace crs::rating {

double EloCalculator::expectedScore(int32_t ratingA, int32_t ratingB) {
    double exponent = static_cast<double>(ratingB - ratingA) / 400.0;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

int32_t EloCalculator::ratingDelta(
    int32_t rating,
    int32_t opponentRating,
    double actualScore,
    int32_t kFactor) {
    double expected = expectedScore(rating, opponentRating);
    double delta = static_cast<double>(kFactor) * (actualScore - expected);
    return static_cast<int32_t>(roundHalfEven(delta));
}

EloUpdate EloCalculator::update(
    int32_t whiteRating,
    int32_t blackRating,
    double whiteScore,
    int32_t kFactor) {
    EloUpdate result;
    result.whiteDelta = ratingDelta(whiteRating, blackRating, whiteScore, kFactor);
    result.blackDelta = ratingDelta(blackRating, whiteRating, 1.0 - whiteScore, kFactor);
    return result;
}

} // namespace crs::rating
