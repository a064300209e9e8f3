#pragma once

/// @file app_config.hpp
/// @brief Settings of one crs_rate run, read from a ConfigManager.

#include <cstddef>
#include <optional>

#include "crs/foundation/rating_logger.hpp"
#include "crs/foundation/rating_result.hpp"
#include "crs/rating/engine_config.hpp"

namespace crs::foundation {
class ConfigManager;
} // namespace crs::foundation

namespace crs::service {

struct AppConfig {
    rating::EngineConfig engine;

    /// Level applied to every log category; empty keeps the built-in defaults.
    std::optional<foundation::LogLevel> logLevel;

    /// Rows in the console summary.
    std::size_t topPlayers = 5;

    /// Read the "rating.*", "logging.level" and "summary.top_players" keys.
    /// Absent keys keep their defaults.
    ///
    /// @return The config, or ConfigTypeMismatch when a key holds the wrong
    ///         kind of value, or ConfigValueOutOfRange for an unknown level
    ///         name or an out-of-range number.
    [[nodiscard]] static foundation::RatingResult<AppConfig> fromConfig(
        const foundation::ConfigManager& config);
};

} // namespace crs::service
