#pragma once

/// @file result_parser.hpp
/// @brief Parsing of one games-log line into a structured game input.
///
/// Line grammar:
/// @code
///   <White Name> - <Black Name> <result>[ <YYYYMMDD>]
/// @endcode
/// where <result> is one of 1:0, 1-0, 0:1, 0-1, 0.5:0.5, 0.5-0.5.

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "crs/foundation/rating_result.hpp"
#include "crs/rating/rating_types.hpp"

namespace crs::rating {

/// A successfully parsed game line.
struct GameInput {
    std::string white;
    std::string black;
    std::string resultToken;     ///< Result exactly as written ("1-0", "0.5:0.5", ...).
    double whiteScore = 0.0;
    double blackScore = 0.0;
    std::optional<std::string> rawDate;  ///< Trailing 8-digit token, if present.
    std::optional<std::string> date;     ///< rawDate rendered as "Mon D, YYYY", if valid.

    [[nodiscard]] GameOutcome whiteOutcome() const { return outcomeForScore(whiteScore); }
    [[nodiscard]] GameOutcome blackOutcome() const { return outcomeForScore(blackScore); }
};

/// Render an 8-digit YYYYMMDD string as "Mon D, YYYY".
///
/// @return std::nullopt for a wrong length, non-digit content, a month
///         outside 1-12 or a day outside 1-31.
[[nodiscard]] std::optional<std::string> formatDate(std::string_view yyyymmdd);

/// Stateless parser for games-log lines.
class ResultParser {
public:
    ResultParser() = delete;

    /// Parse one raw line.
    ///
    /// Rules, applied in order: trim; split on whitespace (at least three
    /// tokens); strip a trailing 8-digit date token when there are more than
    /// three tokens; split the rest at its last whitespace into players and
    /// result token; split players at the first " - "; map the result token
    /// to scores.
    ///
    /// @return The parsed game, or a Parse-subsystem error naming the rule
    ///         that rejected the line.
    [[nodiscard]] static foundation::RatingResult<GameInput> parse(std::string_view line);

    /// Map a result token to (white score, black score).
    [[nodiscard]] static std::optional<std::pair<double, double>> scoresFor(
        std::string_view token);
};

} // namespace crs::rating
