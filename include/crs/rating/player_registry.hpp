#pragma once

/// @file player_registry.hpp
/// @brief Name-keyed store of Player state with lazy creation.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "crs/foundation/rating_result.hpp"
#include "crs/rating/player.hpp"

namespace crs::rating {

/// Owns every Player of a run.
///
/// Names are compared exactly after trimming surrounding whitespace (no case
/// folding). Players are never removed, and references returned by ensure()
/// stay valid for the registry's lifetime.
///
/// Usage:
/// @code
///   PlayerRegistry registry;
///   auto& alice = registry.ensure("Alice");
///   for (const auto& name : registry.names()) { ... }
/// @endcode
class PlayerRegistry {
public:
    /// @param initialElo Starting ELO for newly created players.
    explicit PlayerRegistry(int32_t initialElo = kInitialRating);

    PlayerRegistry(const PlayerRegistry&) = delete;
    PlayerRegistry& operator=(const PlayerRegistry&) = delete;

    /// Return the player called @p name, creating it with the starting
    /// values if absent. Idempotent.
    Player& ensure(std::string_view name);

    /// @return The player, or nullptr if no such name was registered.
    [[nodiscard]] const Player* find(std::string_view name) const;

    /// @return The player, or PlayerNotFound.
    [[nodiscard]] foundation::RatingResult<std::reference_wrapper<const Player>> get(
        std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return players_.size(); }

    /// Player names in first-seen order.
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return order_; }

    [[nodiscard]] int32_t initialElo() const noexcept { return initialElo_; }

private:
    int32_t initialElo_;
    std::unordered_map<std::string, Player> players_;
    std::vector<std::string> order_;
};

} // namespace crs::rating
