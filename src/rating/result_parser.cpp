/// @file result_parser.cpp
/// @brief ResultParser implementation.

#include "crs/rating/result_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace crs::rating {

using foundation::ErrorCode;
using foundation::RatingError;
using foundation::RatingResult;

namespace {

constexpr std::array<std::string_view, 12> kMonthNames = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

constexpr std::string_view kPlayerSeparator = " - ";

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string_view> splitWhitespace(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && isSpace(text[pos])) {
            ++pos;
        }
        auto start = pos;
        while (pos < text.size() && !isSpace(text[pos])) {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(text.substr(start, pos - start));
        }
    }
    return tokens;
}

bool isDateToken(std::string_view token) {
    return token.size() == 8 && std::all_of(token.begin(), token.end(), isDigit);
}

int parseDigits(std::string_view digits) {
    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

RatingResult<GameInput> reject(ErrorCode code, std::string message) {
    return RatingResult<GameInput>::err(RatingError(code, std::move(message)));
}

} // namespace

std::optional<std::string> formatDate(std::string_view yyyymmdd) {
    if (!isDateToken(yyyymmdd)) {
        return std::nullopt;
    }
    auto year = yyyymmdd.substr(0, 4);
    int month = parseDigits(yyyymmdd.substr(4, 2));
    int day = parseDigits(yyyymmdd.substr(6, 2));
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    std::string formatted(kMonthNames[static_cast<std::size_t>(month - 1)]);
    formatted += ' ';
    formatted += std::to_string(day);
    formatted += ", ";
    formatted += year;
    return formatted;
}

std::optional<std::pair<double, double>> ResultParser::scoresFor(std::string_view token) {
    if (token == "1:0" || token == "1-0") {
        return std::make_pair(1.0, 0.0);
    }
    if (token == "0:1" || token == "0-1") {
        return std::make_pair(0.0, 1.0);
    }
    if (token == "0.5:0.5" || token == "0.5-0.5") {
        return std::make_pair(0.5, 0.5);
    }
    return std::nullopt;
}

RatingResult<GameInput> ResultParser::parse(std::string_view line) {
    auto trimmed = trim(line);
    if (trimmed.empty()) {
        return reject(ErrorCode::EmptyLine, "empty line");
    }

    auto tokens = splitWhitespace(trimmed);
    if (tokens.size() < 3) {
        return reject(ErrorCode::TooFewTokens,
                      "expected at least 3 tokens, got " + std::to_string(tokens.size()));
    }

    GameInput input;

    // A trailing date is rejoined with single spaces, like the tokens it follows.
    std::string body;
    if (tokens.size() > 3 && isDateToken(tokens.back())) {
        input.rawDate = std::string(tokens.back());
        input.date = formatDate(tokens.back());
        for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
            if (i > 0) {
                body += ' ';
            }
            body += tokens[i];
        }
    } else {
        body = std::string(trimmed);
    }

    auto lastSpace = std::find_if(body.rbegin(), body.rend(), isSpace);
    if (lastSpace == body.rend()) {
        return reject(ErrorCode::MissingResultToken, "no result token");
    }
    auto splitAt = static_cast<std::size_t>(body.rend() - lastSpace) - 1;
    std::string_view bodyView(body);
    auto players = bodyView.substr(0, splitAt);
    auto resultToken = bodyView.substr(splitAt + 1);

    auto sep = players.find(kPlayerSeparator);
    if (sep == std::string_view::npos) {
        return reject(ErrorCode::MissingPlayerSeparator,
                      "missing \" - \" between player names");
    }
    auto white = trim(players.substr(0, sep));
    auto black = trim(players.substr(sep + kPlayerSeparator.size()));
    if (white.empty() || black.empty()) {
        return reject(ErrorCode::EmptyPlayerName, "empty player name");
    }

    auto scores = scoresFor(resultToken);
    if (!scores) {
        return reject(ErrorCode::InvalidResultToken,
                      "unrecognized result: " + std::string(resultToken));
    }

    input.white = std::string(white);
    input.black = std::string(black);
    input.resultToken = std::string(resultToken);
    input.whiteScore = scores->first;
    input.blackScore = scores->second;
    return RatingResult<GameInput>::ok(std::move(input));
}

} // namespace crs::rating
