/// @file app_config.cpp
/// @brief AppConfig loading from ConfigManager.

#include "crs/service/app_config.hpp"

#include <string>

#include "crs/foundation/config_manager.hpp"

namespace crs::service {

using foundation::ErrorCode;
using foundation::RatingError;
using foundation::RatingResult;

RatingResult<AppConfig> AppConfig::fromConfig(const foundation::ConfigManager& config) {
    AppConfig app;

    auto engine = rating::EngineConfig::fromConfig(config);
    if (!engine) {
        return RatingResult<AppConfig>::err(engine.error());
    }
    app.engine = engine.value();

    auto levelName = config.get<std::string>("logging.level");
    if (levelName) {
        auto level = foundation::parseLogLevel(levelName.value());
        if (!level) {
            return RatingResult<AppConfig>::err(
                RatingError(ErrorCode::ConfigValueOutOfRange,
                            "logging.level: " + std::string(level.error().message())));
        }
        app.logLevel = level.value();
    } else if (levelName.error().code() != ErrorCode::ConfigKeyNotFound) {
        return RatingResult<AppConfig>::err(levelName.error());
    }

    auto topPlayers = config.getOr<int>("summary.top_players", static_cast<int>(app.topPlayers));
    if (!topPlayers) {
        return RatingResult<AppConfig>::err(topPlayers.error());
    }
    if (topPlayers.value() < 0) {
        return RatingResult<AppConfig>::err(
            RatingError(ErrorCode::ConfigValueOutOfRange,
                        "summary.top_players out of range: " +
                        std::to_string(topPlayers.value())));
    }
    app.topPlayers = static_cast<std::size_t>(topPlayers.value());

    return RatingResult<AppConfig>::ok(app);
}

} // namespace crs::service
