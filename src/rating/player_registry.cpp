/// @file player_registry.cpp
/// @brief PlayerRegistry implementation.

#include "crs/rating/player_registry.hpp"

#include <cctype>

#include "crs/foundation/rating_logger.hpp"

namespace crs::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RatingError;
using foundation::RatingResult;

namespace {

std::string trimmedKey(std::string_view name) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!name.empty() && isSpace(name.front())) {
        name.remove_prefix(1);
    }
    while (!name.empty() && isSpace(name.back())) {
        name.remove_suffix(1);
    }
    return std::string(name);
}

} // namespace

PlayerRegistry::PlayerRegistry(int32_t initialElo) : initialElo_(initialElo) {}

Player& PlayerRegistry::ensure(std::string_view name) {
    auto key = trimmedKey(name);
    auto it = players_.find(key);
    if (it != players_.end()) {
        return it->second;
    }

    auto& player = players_.try_emplace(key, key, initialElo_).first->second;
    order_.push_back(key);
    CRS_LOG_DEBUG(LogCategory::Registry, "new player: " + key);
    return player;
}

const Player* PlayerRegistry::find(std::string_view name) const {
    auto it = players_.find(trimmedKey(name));
    return it != players_.end() ? &it->second : nullptr;
}

RatingResult<std::reference_wrapper<const Player>> PlayerRegistry::get(
    std::string_view name) const {
    const auto* player = find(name);
    if (player == nullptr) {
        return RatingResult<std::reference_wrapper<const Player>>::err(
            RatingError(ErrorCode::PlayerNotFound,
                        "unknown player: " + std::string(name)));
    }
    return RatingResult<std::reference_wrapper<const Player>>::ok(std::cref(*player));
}

bool PlayerRegistry::contains(std::string_view name) const {
    return find(name) != nullptr;
}

} // namespace crs::rating
