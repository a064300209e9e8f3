#pragma once

/// @file engine_config.hpp
/// @brief Tunables for the rating engine.

#include <cstddef>
#include <cstdint>

#include "crs/foundation/rating_result.hpp"
#include "crs/rating/elo_calculator.hpp"
#include "crs/rating/player.hpp"

namespace crs::foundation {
class ConfigManager;
} // namespace crs::foundation

namespace crs::rating {

/// Engine configuration. Defaults reproduce the standard setup: ELO 1200,
/// K = 32, top-5 notable result lists.
struct EngineConfig {
    int32_t initialElo = kInitialRating;
    int32_t eloKFactor = EloCalculator::kDefaultKFactor;
    std::size_t notableResultsLimit = kDefaultNotableResultsLimit;

    /// Build from the "rating.*" keys of @p config. Absent keys keep their
    /// defaults.
    ///
    /// @return The config, or ConfigTypeMismatch / ConfigValueOutOfRange.
    [[nodiscard]] static foundation::RatingResult<EngineConfig> fromConfig(
        const foundation::ConfigManager& config);
};

} // namespace crs::rating
