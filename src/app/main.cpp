/// @file main.cpp
/// @brief crs_rate entry point.
///
/// Reads a games log, rates every game with ELO, Glicko-2 and USCF and
/// prints a summary of the top players.
///
/// Usage: crs_rate [--config <file.yaml>] [games.txt]

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include "crs/foundation/config_manager.hpp"
#include "crs/foundation/console_logger.hpp"
#include "crs/foundation/rating_logger.hpp"
#include "crs/rating/player_registry.hpp"
#include "crs/rating/rating_engine.hpp"
#include "crs/service/app_config.hpp"
#include "crs/service/game_log_loader.hpp"
#include "crs/service/rating_summary.hpp"

namespace {

struct CliArgs {
    std::filesystem::path configPath;
    std::filesystem::path gamesPath = "games.txt";
};

CliArgs parseArgs(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config" && i + 1 < argc) {
            args.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else {
            args.gamesPath = arg;
        }
    }

    // Environment variable override when no --config was given.
    const char* envPath = std::getenv("CRS_CONFIG_PATH");
    if (args.configPath.empty() && envPath != nullptr) {
        args.configPath = envPath;
    }
    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    using crs::foundation::LogCategory;

    crs::foundation::ConsoleLogger::installAsDefault();
    auto& logger = crs::foundation::RatingLogger::instance();
    logger.setAllLevels(crs::foundation::LogLevel::Info);

    auto args = parseArgs(argc, argv);

    crs::foundation::ConfigManager config;
    if (!args.configPath.empty()) {
        auto loadResult = config.load(args.configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: "
                      << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
        CRS_LOG_INFO(LogCategory::Config, "loaded " + args.configPath.string());
    }

    auto appCfg = crs::service::AppConfig::fromConfig(config);
    if (!appCfg) {
        std::cerr << "Invalid config: " << appCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& settings = appCfg.value();
    if (settings.logLevel) {
        logger.setAllLevels(*settings.logLevel);
    }

    auto lines = crs::service::GameLogLoader::readLines(args.gamesPath);
    if (!lines) {
        std::cerr << "Error: " << lines.error().message() << "\n";
        return EXIT_FAILURE;
    }

    crs::rating::PlayerRegistry registry(settings.engine.initialElo);
    crs::rating::RatingEngine engine(registry, settings.engine);
    auto stats = engine.processLog(lines.value());

    std::cout << "Processed " << stats.gamesRecorded << " games for "
              << registry.size() << " players\n\n";

    auto summary = crs::service::RatingSummary::build(
        registry, engine.games().size(), settings.topPlayers);
    std::cout << summary.render();

    auto flushed = logger.flush();
    if (!flushed) {
        std::cerr << "Warning: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
