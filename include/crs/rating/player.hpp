#pragma once

/// @file player.hpp
/// @brief Per-player rating and statistics state.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "crs/rating/glicko2_calculator.hpp"
#include "crs/rating/rating_types.hpp"
#include "crs/rating/uscf_calculator.hpp"

namespace crs::rating {

/// Maximum length of the biggest-wins and biggest-upsets lists.
inline constexpr std::size_t kDefaultNotableResultsLimit = 5;

/// Head-to-head record against one opponent.
struct OpponentTally {
    uint32_t games = 0;
    uint32_t wins = 0;
    uint32_t draws = 0;
    uint32_t losses = 0;
};

/// A decisive result against a player with a different pre-game ELO.
struct NotableResult {
    std::string opponent;
    int32_t ratingGap = 0;       ///< |own pre-game ELO - opponent pre-game ELO|
    int32_t ownRating = 0;
    int32_t opponentRating = 0;
    uint32_t gameNumber = 0;
    std::optional<std::string> date;
};

/// Ratings right after one of the player's games.
struct HistoryEntry {
    uint32_t gameNumber = 0;
    std::string label;  ///< Formatted date, or "Game N" when the line had none.
    int32_t elo = 0;
    int32_t glicko = 0;
    int32_t uscf = 0;
};

/// Highest and lowest value a rating has taken, starting value included.
struct RatingExtremes {
    int32_t highest = kInitialRating;
    int32_t lowest = kInitialRating;

    void observe(int32_t rating);
};

/// Mutable state of one participant.
struct Player {
    explicit Player(std::string playerName, int32_t initialElo = kInitialRating);

    std::string name;

    int32_t elo = kInitialRating;
    Glicko2Rating glicko;
    UscfRating uscf;

    uint32_t games = 0;
    uint32_t wins = 0;
    uint32_t draws = 0;
    uint32_t losses = 0;

    std::unordered_map<std::string, OpponentTally> opponents;

    std::vector<NotableResult> biggestWins;
    std::vector<NotableResult> biggestUpsets;

    RatingExtremes eloExtremes;
    RatingExtremes glickoExtremes;
    RatingExtremes uscfExtremes;

    std::vector<HistoryEntry> history;

    /// Fold the current ratings of all three systems into the extremes.
    void observeRatings();

    /// Count a finished game against @p opponent in the totals and in the
    /// head-to-head tally (created zeroed on first encounter).
    void recordOutcome(const std::string& opponent, GameOutcome outcome);

    /// (wins + draws / 2) / games * 100, or 0 without games.
    [[nodiscard]] double scorePercentage() const;
};

/// Append @p entry to @p list, keep it sorted by descending rating gap and
/// cut it to @p limit entries. Entries with equal gaps keep insertion order,
/// so a new entry goes after existing ones with the same gap.
void recordNotableResult(std::vector<NotableResult>& list,
                         NotableResult entry,
                         std::size_t limit = kDefaultNotableResultsLimit);

} // namespace crs::rating
