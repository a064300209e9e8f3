#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the rating system.

#include <cstdint>
#include <string_view>

namespace crs::foundation {

/// Error codes grouped by subsystem in 256-value ranges (0x100 each),
/// so the source of an error can be read off the code value.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Parse (0x0100 - 0x01FF)
    EmptyLine = 0x0100,
    TooFewTokens = 0x0101,
    MissingResultToken = 0x0102,
    MissingPlayerSeparator = 0x0103,
    EmptyPlayerName = 0x0104,
    InvalidResultToken = 0x0105,
    InvalidDate = 0x0106,

    // Rating (0x0200 - 0x02FF)
    PlayerNotFound = 0x0200,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueOutOfRange = 0x0603,

    // IO (0x0700 - 0x07FF)
    FileNotFound = 0x0700,
    FileReadFailed = 0x0701,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto category = static_cast<uint32_t>(code) & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Parse";
        case 0x0200: return "Rating";
        case 0x0600: return "Config";
        case 0x0700: return "IO";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace crs::foundation
