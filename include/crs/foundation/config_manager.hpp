#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "crs/foundation/rating_result.hpp"

namespace crs::foundation {

/// YAML configuration store.
///
/// The YAML tree is flattened into dotted keys ("rating.elo_k_factor") on
/// load, so lookups never hold on to yaml-cpp node references.
///
/// Example:
/// @code
///   ConfigManager config;
///   if (auto loaded = config.load("crs.yaml"); !loaded) {
///       std::cerr << loaded.error().message() << "\n";
///   }
///   auto k = config.getOr<int>("rating.elo_k_factor", 32);
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    RatingResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    RatingResult<void> loadFromString(std::string_view yaml);

    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch. A key
    ///         that names a mapping ("rating") is ConfigTypeMismatch.
    template <typename T>
    RatingResult<T> get(std::string_view key) const;

    /// Like get(), but an absent key yields @p fallback instead of an error.
    /// A present key of the wrong type is still ConfigTypeMismatch.
    template <typename T>
    RatingResult<T> getOr(std::string_view key, T fallback) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    /// True if some entry lives under "<key>.". Caller holds mutex_.
    bool hasSectionLocked(std::string_view key) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
RatingResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        if (hasSectionLocked(key)) {
            return RatingResult<T>::err(
                RatingError(ErrorCode::ConfigTypeMismatch,
                            std::string("key is a section, not a value: ") +
                            std::string(key)));
        }
        return RatingResult<T>::err(
            RatingError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return RatingResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return RatingResult<T>::err(
            RatingError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
RatingResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return RatingResult<T>::ok(std::move(fallback));
    }
    return result;
}

} // namespace crs::foundation
