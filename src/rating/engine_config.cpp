/// @file engine_config.cpp
/// @brief EngineConfig loading from ConfigManager.

#include "crs/rating/engine_config.hpp"

#include <string>

#include "crs/foundation/config_manager.hpp"

namespace crs::rating {

using foundation::ErrorCode;
using foundation::RatingError;
using foundation::RatingResult;

namespace {

RatingResult<EngineConfig> outOfRange(const char* key, int value) {
    return RatingResult<EngineConfig>::err(
        RatingError(ErrorCode::ConfigValueOutOfRange,
                    std::string(key) + " out of range: " + std::to_string(value)));
}

} // namespace

RatingResult<EngineConfig> EngineConfig::fromConfig(const foundation::ConfigManager& config) {
    EngineConfig cfg;

    auto initialElo = config.getOr<int>("rating.initial_elo", cfg.initialElo);
    if (!initialElo) {
        return RatingResult<EngineConfig>::err(initialElo.error());
    }
    if (initialElo.value() <= 0) {
        return outOfRange("rating.initial_elo", initialElo.value());
    }
    cfg.initialElo = initialElo.value();

    auto kFactor = config.getOr<int>("rating.elo_k_factor", cfg.eloKFactor);
    if (!kFactor) {
        return RatingResult<EngineConfig>::err(kFactor.error());
    }
    if (kFactor.value() < 1) {
        return outOfRange("rating.elo_k_factor", kFactor.value());
    }
    cfg.eloKFactor = kFactor.value();

    auto limit = config.getOr<int>("rating.notable_results_limit",
                                   static_cast<int>(cfg.notableResultsLimit));
    if (!limit) {
        return RatingResult<EngineConfig>::err(limit.error());
    }
    if (limit.value() < 1) {
        return outOfRange("rating.notable_results_limit", limit.value());
    }
    cfg.notableResultsLimit = static_cast<std::size_t>(limit.value());

    return RatingResult<EngineConfig>::ok(cfg);
}

} // namespace crs::rating
