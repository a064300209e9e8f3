/// @file glicko2_calculator.cpp
/// @brief Glicko2Calculator implementation.

#include "crs/rating/glicko2_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace crs::rating {

namespace {

double roundTo(double value, double scale) {
    return roundHalfEven(value * scale) / scale;
}

} // namespace

double Glicko2Calculator::toMu(double rating) {
    return (rating - kBaseRating) / kScale;
}

double Glicko2Calculator::toPhi(double deviation) {
    return deviation / kScale;
}

double Glicko2Calculator::fromMu(double mu) {
    return mu * kScale + kBaseRating;
}

double Glicko2Calculator::g(double phi) {
    constexpr double kPiSquared = std::numbers::pi * std::numbers::pi;
    return 1.0 / std::sqrt(1.0 + 3.0 * phi * phi / kPiSquared);
}

double Glicko2Calculator::expectedScore(double mu, double muJ, double phiJ) {
    return 1.0 / (1.0 + std::exp(-g(phiJ) * (mu - muJ)));
}

Glicko2Rating Glicko2Calculator::update(
    const Glicko2Rating& self,
    const Glicko2Rating& opponent,
    double score) {
    double mu = toMu(self.rating);
    double phi = toPhi(self.deviation);
    double sigma = self.volatility;
    double muJ = toMu(opponent.rating);
    double phiJ = toPhi(opponent.deviation);

    double gJ = g(phiJ);
    double expected = expectedScore(mu, muJ, phiJ);

    double v = 1.0 / (gJ * gJ * expected * (1.0 - expected));
    double delta = v * gJ * (score - expected);

    double newSigma = std::sqrt((sigma * sigma + delta * delta / v) / 2.0);
    newSigma = std::min(newSigma, kVolatilityCap);

    double preRatingPhi = std::sqrt(phi * phi + newSigma * newSigma);
    double newPhi = 1.0 / std::sqrt(1.0 / (preRatingPhi * preRatingPhi) + 1.0 / v);
    double newMu = mu + newPhi * newPhi * gJ * (score - expected);

    Glicko2Rating result;
    result.rating = static_cast<int32_t>(roundHalfEven(fromMu(newMu)));
    result.deviation = roundTo(newPhi * kScale, 10.0);
    result.volatility = roundTo(newSigma, 10000.0);
    return result;
}

} // namespace crs::rating
