/// @file player.cpp
/// @brief Player bookkeeping.

#include "crs/rating/player.hpp"

#include <algorithm>
#include <utility>

namespace crs::rating {

void RatingExtremes::observe(int32_t rating) {
    highest = std::max(highest, rating);
    lowest = std::min(lowest, rating);
}

Player::Player(std::string playerName, int32_t initialElo)
    : name(std::move(playerName)),
      elo(initialElo),
      eloExtremes{initialElo, initialElo} {}

void Player::observeRatings() {
    eloExtremes.observe(elo);
    glickoExtremes.observe(glicko.rating);
    uscfExtremes.observe(uscf.rating);
}

void Player::recordOutcome(const std::string& opponent, GameOutcome outcome) {
    auto& tally = opponents[opponent];
    ++games;
    ++tally.games;
    switch (outcome) {
        case GameOutcome::Win:
            ++wins;
            ++tally.wins;
            break;
        case GameOutcome::Draw:
            ++draws;
            ++tally.draws;
            break;
        case GameOutcome::Loss:
            ++losses;
            ++tally.losses;
            break;
    }
}

double Player::scorePercentage() const {
    if (games == 0) {
        return 0.0;
    }
    double points = static_cast<double>(wins) + 0.5 * static_cast<double>(draws);
    return points / static_cast<double>(games) * 100.0;
}

void recordNotableResult(std::vector<NotableResult>& list,
                         NotableResult entry,
                         std::size_t limit) {
    // First position whose gap is strictly smaller: equal gaps stay ahead.
    auto pos = std::upper_bound(
        list.begin(), list.end(), entry.ratingGap,
        [](int32_t gap, const NotableResult& existing) { return gap > existing.ratingGap; });
    list.insert(pos, std::move(entry));
    if (list.size() > limit) {
        list.resize(limit);
    }
}

} // namespace crs::rating
