/// @file game_log_loader.cpp
/// @brief GameLogLoader implementation.

#include "crs/service/game_log_loader.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "crs/foundation/rating_logger.hpp"

namespace crs::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RatingError;
using foundation::RatingResult;

RatingResult<std::vector<std::string>> GameLogLoader::readLines(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return RatingResult<std::vector<std::string>>::err(
            RatingError(ErrorCode::FileNotFound,
                        "could not find file '" + path.string() + "'"));
    }

    std::ifstream in(path);
    if (!in) {
        return RatingResult<std::vector<std::string>>::err(
            RatingError(ErrorCode::FileReadFailed,
                        "could not open file '" + path.string() + "'"));
    }

    auto lines = readLines(in);
    if (lines) {
        CRS_LOG_INFO(LogCategory::Loader,
                     "read " + std::to_string(lines.value().size()) +
                     " lines from " + path.string());
    }
    return lines;
}

RatingResult<std::vector<std::string>> GameLogLoader::readLines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        line.clear();
    }
    if (in.bad()) {
        return RatingResult<std::vector<std::string>>::err(
            RatingError(ErrorCode::FileReadFailed, "I/O error while reading games log"));
    }
    return RatingResult<std::vector<std::string>>::ok(std::move(lines));
}

} // namespace crs::service
