#pragma once

/// @file rating_logger.hpp
/// @brief RatingLogger wrapping kcenon common_system logging for the rating engine.
///
/// Provides category-based filtering, structured logging with context and
/// per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "crs/foundation/rating_result.hpp"

namespace crs::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level one-to-one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per subsystem.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Batch processing and application flow
    Parser   = 1, ///< Result line parsing
    Rating   = 2, ///< Rating updates and bookkeeping
    Registry = 3, ///< Player creation
    Config   = 4, ///< Configuration loading
    Loader   = 5  ///< Games file loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Parser", "Rating", "Registry", "Config", "Loader"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a case-insensitive level name ("debug", "Info", "off", ...).
/// Returns InvalidArgument for unknown names.
[[nodiscard]] RatingResult<LogLevel> parseLogLevel(std::string_view name);

/// Structured context appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerName = "Alice";
///   ctx.gameNumber = 12;
///   ctx.extra["elo_delta"] = "+16";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Rating,
///                         "Game recorded", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> playerName;
    std::optional<uint32_t> gameNumber;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger over kcenon's GlobalLoggerRegistry.
///
/// Each category is routed to the registry logger named "crs.<Category>"
/// and falls back to the registry's default logger. The kcenon headers are
/// kept behind a PIMPL.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Parser   | Debug         |
/// | Rating   | Debug         |
/// | Registry | Debug         |
/// | Config   | Info          |
/// | Loader   | Info          |
class RatingLogger {
public:
    RatingLogger();
    ~RatingLogger();

    RatingLogger(const RatingLogger&) = delete;
    RatingLogger& operator=(const RatingLogger&) = delete;
    RatingLogger(RatingLogger&&) noexcept;
    RatingLogger& operator=(RatingLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by a {key=value, ...} context block.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply the same minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default registry logger.
    RatingResult<void> flush();

    static RatingLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace crs::foundation

/// @name CRS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define CRS_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef CRS_MIN_LOG_LEVEL
    #define CRS_MIN_LOG_LEVEL 0
#endif

#define CRS_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= CRS_MIN_LOG_LEVEL &&                        \
            ::crs::foundation::RatingLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::crs::foundation::RatingLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define CRS_LOG_DEBUG(cat, msg) \
    CRS_LOG(::crs::foundation::LogLevel::Debug, (cat), (msg))

#define CRS_LOG_INFO(cat, msg) \
    CRS_LOG(::crs::foundation::LogLevel::Info, (cat), (msg))

#define CRS_LOG_WARN(cat, msg) \
    CRS_LOG(::crs::foundation::LogLevel::Warning, (cat), (msg))

#define CRS_LOG_ERROR(cat, msg) \
    CRS_LOG(::crs::foundation::LogLevel::Error, (cat), (msg))

/// @}
