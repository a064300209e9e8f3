#pragma once

/// @file rating_engine.hpp
/// @brief Game-by-game orchestration of parsing, rating updates and bookkeeping.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "crs/rating/engine_config.hpp"
#include "crs/rating/game_record.hpp"
#include "crs/rating/player_registry.hpp"
#include "crs/rating/result_parser.hpp"

namespace crs::rating {

/// Counters for one processLog() call.
struct IngestStats {
    uint32_t linesRead = 0;
    uint32_t gamesRecorded = 0;
    uint32_t linesSkipped = 0;
};

/// Applies games in log order to a PlayerRegistry.
///
/// For each game the ELO, Glicko-2 and USCF updates are computed from the
/// same pre-game snapshots, then extremes, win/draw/loss totals,
/// head-to-head tallies, notable results and history are updated, and an
/// immutable GameRecord is appended. A line that does not parse changes
/// nothing but still consumes its sequence number.
///
/// Not thread-safe: games must be applied one at a time, in order.
///
/// Usage:
/// @code
///   PlayerRegistry registry;
///   RatingEngine engine(registry);
///   auto stats = engine.processLog(lines);
///   for (const auto& game : engine.games()) { ... }
/// @endcode
class RatingEngine {
public:
    /// @param registry Player store; must outlive the engine.
    explicit RatingEngine(PlayerRegistry& registry, EngineConfig config = {});

    RatingEngine(const RatingEngine&) = delete;
    RatingEngine& operator=(const RatingEngine&) = delete;

    /// Parse and apply one line.
    ///
    /// @param sequence 1-based position of the line in the log.
    /// @return true if a game was recorded, false if the line was skipped.
    bool processLine(std::string_view line, uint32_t sequence);

    /// Apply every line in order. Numbering continues after the highest
    /// sequence number seen so far (1 for a fresh engine).
    IngestStats processLog(const std::vector<std::string>& lines);

    /// Apply an already-parsed game.
    const GameRecord& recordGame(const GameInput& input, uint32_t sequence);

    [[nodiscard]] const std::vector<GameRecord>& games() const noexcept { return games_; }

    [[nodiscard]] const PlayerRegistry& registry() const noexcept { return registry_; }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    /// Highest sequence number passed to processLine()/recordGame() so far.
    [[nodiscard]] uint32_t lastSequence() const noexcept { return lastSequence_; }

private:
    void recordNotableResults(Player& white, Player& black, const GameInput& input,
                              int32_t whiteBefore, int32_t blackBefore,
                              uint32_t sequence);

    PlayerRegistry& registry_;
    EngineConfig config_;
    std::vector<GameRecord> games_;
    uint32_t lastSequence_ = 0;
};

} // namespace crs::rating
