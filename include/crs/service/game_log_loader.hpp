#pragma once

/// @file game_log_loader.hpp
/// @brief Reads a games log from disk.

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "crs/foundation/rating_result.hpp"

namespace crs::service {

class GameLogLoader {
public:
    GameLogLoader() = delete;

    /// Read every line of @p path. Line endings ("\n" or "\r\n") are
    /// stripped; blank lines are kept so line numbers stay aligned.
    ///
    /// @return The lines, or FileNotFound / FileReadFailed.
    [[nodiscard]] static foundation::RatingResult<std::vector<std::string>> readLines(
        const std::filesystem::path& path);

    /// Read every line of an already-open stream.
    [[nodiscard]] static foundation::RatingResult<std::vector<std::string>> readLines(
        std::istream& in);
};

} // namespace crs::service
