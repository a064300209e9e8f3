#pragma once

/// @file glicko2_calculator.hpp
/// @brief Single-game Glicko-2 approximation.
///
/// This is a one-opponent, one-period variant. The new volatility is taken
/// analytically and capped instead of being found by the iterative
/// procedure of the full Glicko-2 algorithm:
///
///   mu = (r - 1200) / 173.7178, phi = RD / 173.7178
///   g(phi) = 1 / sqrt(1 + 3 phi^2 / pi^2)
///   E = 1 / (1 + exp(-g(phi_j) (mu - mu_j)))
///   v = 1 / (g^2 E (1 - E)),  Delta = v g (s - E)
///   sigma' = min(sqrt((sigma^2 + Delta^2 / v) / 2), 0.2)
///   phi'   = 1 / sqrt(1 / (phi^2 + sigma'^2) + 1 / v)
///   mu'    = mu + phi'^2 g (s - E)

#include <cstdint>

#include "crs/rating/rating_types.hpp"

namespace crs::rating {

/// A player's Glicko-2 state on the display scale.
struct Glicko2Rating {
    int32_t rating = kInitialRating;
    double deviation = kInitialGlickoDeviation;  ///< Rounded to 1 decimal.
    double volatility = kInitialGlickoVolatility;  ///< Rounded to 4 decimals.
};

class Glicko2Calculator {
public:
    Glicko2Calculator() = delete;

    /// Display-to-internal scale factor (400 / ln 10).
    static constexpr double kScale = 173.7178;
    static constexpr double kBaseRating = 1200.0;
    static constexpr double kVolatilityCap = 0.2;

    [[nodiscard]] static double toMu(double rating);
    [[nodiscard]] static double toPhi(double deviation);
    [[nodiscard]] static double fromMu(double mu);

    /// Impact reduction for an opponent with deviation @p phi.
    [[nodiscard]] static double g(double phi);

    /// Expected score against an opponent at (@p muJ, @p phiJ).
    [[nodiscard]] static double expectedScore(double mu, double muJ, double phiJ);

    /// New state for @p self after scoring @p score against @p opponent.
    /// Both arguments are pre-game states. Call once per side.
    [[nodiscard]] static Glicko2Rating update(
        const Glicko2Rating& self,
        const Glicko2Rating& opponent,
        double score);
};

} // namespace crs::rating
