/// @file uscf_calculator.cpp
/// @brief UscfCalculator implementation.

#include "crs/rating/uscf_calculator.hpp"

#include "crs/rating/elo_calculator.hpp"

namespace crs::rating {

int32_t UscfCalculator::kFactor(const UscfRating& player) {
    if (player.games < kProvisionalGames) {
        return kProvisionalKFactor;
    }
    if (player.rating < kMasterThreshold) {
        return kRegularKFactor;
    }
    return kMasterKFactor;
}

UscfRating UscfCalculator::update(
    const UscfRating& self,
    const UscfRating& opponent,
    double score) {
    UscfRating result;
    result.rating = self.rating +
        EloCalculator::ratingDelta(self.rating, opponent.rating, score, kFactor(self));
    result.games = self.games + 1;
    return result;
}

} // namespace crs::rating
