/// @file rating_summary.cpp
/// @brief RatingSummary implementation.

#include "crs/service/rating_summary.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace crs::service {

RatingSummary RatingSummary::build(const rating::PlayerRegistry& registry,
                                   std::size_t totalGames,
                                   std::size_t topN) {
    RatingSummary summary;
    summary.totalPlayers = registry.size();
    summary.totalGames = totalGames;

    std::vector<const rating::Player*> ranked;
    ranked.reserve(registry.size());
    for (const auto& name : registry.names()) {
        ranked.push_back(registry.find(name));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const rating::Player* a, const rating::Player* b) {
                         return a->elo > b->elo;
                     });

    auto count = std::min(topN, ranked.size());
    for (std::size_t i = 0; i < count; ++i) {
        const auto& player = *ranked[i];
        SummaryRow row;
        row.rank = i + 1;
        row.name = player.name;
        row.elo = player.elo;
        row.wins = player.wins;
        row.draws = player.draws;
        row.losses = player.losses;
        row.scorePercentage = player.scorePercentage();
        summary.topPlayers.push_back(std::move(row));
    }
    return summary;
}

std::string RatingSummary::render() const {
    std::ostringstream oss;
    oss << "Rating Summary:\n"
        << "Total players: " << totalPlayers << "\n"
        << "Total games: " << totalGames << "\n";

    if (topPlayers.empty()) {
        return oss.str();
    }

    oss << "\nTop " << topPlayers.size() << " Players:\n";
    oss << std::fixed << std::setprecision(1);
    for (const auto& row : topPlayers) {
        oss << row.rank << ". " << row.name << ": " << row.elo
            << " (" << row.wins << '-' << row.draws << '-' << row.losses
            << ", " << row.scorePercentage << "%)\n";
    }
    return oss.str();
}

} // namespace crs::service
