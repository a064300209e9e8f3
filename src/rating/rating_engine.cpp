/// @file rating_engine.cpp
/// @brief RatingEngine implementation.

#include "crs/rating/rating_engine.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

#include "crs/foundation/rating_logger.hpp"
#include "crs/rating/elo_calculator.hpp"
#include "crs/rating/glicko2_calculator.hpp"
#include "crs/rating/uscf_calculator.hpp"

namespace crs::rating {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RatingLogger;

namespace {

std::string signedDelta(int32_t delta) {
    return delta > 0 ? "+" + std::to_string(delta) : std::to_string(delta);
}

HistoryEntry snapshot(const Player& player, uint32_t sequence, const std::string& label) {
    HistoryEntry entry;
    entry.gameNumber = sequence;
    entry.label = label;
    entry.elo = player.elo;
    entry.glicko = player.glicko.rating;
    entry.uscf = player.uscf.rating;
    return entry;
}

} // namespace

RatingEngine::RatingEngine(PlayerRegistry& registry, EngineConfig config)
    : registry_(registry), config_(config) {}

bool RatingEngine::processLine(std::string_view line, uint32_t sequence) {
    lastSequence_ = std::max(lastSequence_, sequence);

    auto parsed = ResultParser::parse(line);
    if (!parsed) {
        auto& logger = RatingLogger::instance();
        if (logger.isEnabled(LogLevel::Debug, LogCategory::Parser)) {
            LogContext ctx;
            ctx.gameNumber = sequence;
            ctx.extra["reason"] = std::string(parsed.error().message());
            logger.logWithContext(LogLevel::Debug, LogCategory::Parser,
                                  "line skipped", ctx);
        }
        return false;
    }

    recordGame(parsed.value(), sequence);
    return true;
}

IngestStats RatingEngine::processLog(const std::vector<std::string>& lines) {
    IngestStats stats;
    uint32_t sequence = lastSequence_;
    for (const auto& line : lines) {
        ++sequence;
        ++stats.linesRead;
        if (processLine(line, sequence)) {
            ++stats.gamesRecorded;
        } else {
            ++stats.linesSkipped;
        }
    }

    CRS_LOG_INFO(LogCategory::Core,
                 "processed " + std::to_string(stats.linesRead) + " lines: " +
                 std::to_string(stats.gamesRecorded) + " games, " +
                 std::to_string(stats.linesSkipped) + " skipped, " +
                 std::to_string(registry_.size()) + " players");
    return stats;
}

const GameRecord& RatingEngine::recordGame(const GameInput& input, uint32_t sequence) {
    lastSequence_ = std::max(lastSequence_, sequence);

    // Both references stay valid: the registry never relocates players.
    auto& white = registry_.ensure(input.white);
    auto& black = registry_.ensure(input.black);

    const int32_t whiteBefore = white.elo;
    const int32_t blackBefore = black.elo;
    const Glicko2Rating whiteGlicko = white.glicko;
    const Glicko2Rating blackGlicko = black.glicko;
    const UscfRating whiteUscf = white.uscf;
    const UscfRating blackUscf = black.uscf;

    auto elo = EloCalculator::update(whiteBefore, blackBefore, input.whiteScore,
                                     config_.eloKFactor);
    white.elo += elo.whiteDelta;
    black.elo += elo.blackDelta;

    white.glicko = Glicko2Calculator::update(whiteGlicko, blackGlicko, input.whiteScore);
    black.glicko = Glicko2Calculator::update(blackGlicko, whiteGlicko, input.blackScore);

    // Applied as deltas so a player listed on both sides keeps both updates.
    auto whiteUscfAfter = UscfCalculator::update(whiteUscf, blackUscf, input.whiteScore);
    auto blackUscfAfter = UscfCalculator::update(blackUscf, whiteUscf, input.blackScore);
    white.uscf.rating += whiteUscfAfter.rating - whiteUscf.rating;
    ++white.uscf.games;
    black.uscf.rating += blackUscfAfter.rating - blackUscf.rating;
    ++black.uscf.games;

    white.observeRatings();
    black.observeRatings();

    white.recordOutcome(black.name, input.whiteOutcome());
    black.recordOutcome(white.name, input.blackOutcome());

    recordNotableResults(white, black, input, whiteBefore, blackBefore, sequence);

    const std::string label = input.date ? *input.date : "Game " + std::to_string(sequence);
    white.history.push_back(snapshot(white, sequence, label));
    black.history.push_back(snapshot(black, sequence, label));

    GameRecord record;
    record.gameNumber = sequence;
    record.white = white.name;
    record.black = black.name;
    record.result = input.resultToken;
    record.date = input.date;
    record.rawDate = input.rawDate;
    record.whiteRatingBefore = whiteBefore;
    record.blackRatingBefore = blackBefore;
    record.whiteRatingAfter = white.elo;
    record.blackRatingAfter = black.elo;
    record.whiteChange = elo.whiteDelta;
    record.blackChange = elo.blackDelta;
    games_.push_back(std::move(record));

    auto& logger = RatingLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Rating)) {
        LogContext ctx;
        ctx.gameNumber = sequence;
        ctx.extra["white"] = white.name + " " + signedDelta(elo.whiteDelta);
        ctx.extra["black"] = black.name + " " + signedDelta(elo.blackDelta);
        logger.logWithContext(LogLevel::Debug, LogCategory::Rating,
                              "game recorded: " + input.resultToken, ctx);
    }

    return games_.back();
}

void RatingEngine::recordNotableResults(Player& white, Player& black,
                                        const GameInput& input,
                                        int32_t whiteBefore, int32_t blackBefore,
                                        uint32_t sequence) {
    auto outcome = input.whiteOutcome();
    if (outcome == GameOutcome::Draw) {
        return;
    }

    Player& winner = outcome == GameOutcome::Win ? white : black;
    Player& loser = outcome == GameOutcome::Win ? black : white;
    const int32_t winnerBefore = outcome == GameOutcome::Win ? whiteBefore : blackBefore;
    const int32_t loserBefore = outcome == GameOutcome::Win ? blackBefore : whiteBefore;

    // Only a win over a higher-rated opponent is notable, for both sides.
    if (loserBefore <= winnerBefore) {
        return;
    }
    const int32_t gap = std::abs(whiteBefore - blackBefore);

    NotableResult win;
    win.opponent = loser.name;
    win.ratingGap = gap;
    win.ownRating = winnerBefore;
    win.opponentRating = loserBefore;
    win.gameNumber = sequence;
    win.date = input.date;
    recordNotableResult(winner.biggestWins, std::move(win), config_.notableResultsLimit);

    NotableResult upset;
    upset.opponent = winner.name;
    upset.ratingGap = gap;
    upset.ownRating = loserBefore;
    upset.opponentRating = winnerBefore;
    upset.gameNumber = sequence;
    upset.date = input.date;
    recordNotableResult(loser.biggestUpsets, std::move(upset), config_.notableResultsLimit);
}

} // namespace crs::rating
