#pragma once

/// @file game_record.hpp
/// @brief Immutable record of one rated game.

#include <cstdint>
#include <optional>
#include <string>

namespace crs::rating {

/// One rated game as seen by report consumers. Only ELO values are carried
/// here; Glicko-2 and USCF changes live in player state and history.
struct GameRecord {
    uint32_t gameNumber = 0;        ///< 1-based line position in the log.
    std::string white;
    std::string black;
    std::string result;             ///< Raw result token.
    std::optional<std::string> date;     ///< "Mon D, YYYY"
    std::optional<std::string> rawDate;  ///< "YYYYMMDD"

    int32_t whiteRatingBefore = 0;
    int32_t blackRatingBefore = 0;
    int32_t whiteRatingAfter = 0;
    int32_t blackRatingAfter = 0;
    int32_t whiteChange = 0;
    int32_t blackChange = 0;
};

} // namespace crs::rating
