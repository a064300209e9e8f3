/// @file config_manager.cpp
/// @brief YAML-backed ConfigManager implementation.

#include "crs/foundation/config_manager.hpp"

namespace crs::foundation {

RatingResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return RatingResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        std::string("YAML parse error: ") + e.what()));
    }
}

RatingResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return RatingResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::ConfigLoadFailed,
                        std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

bool ConfigManager::hasSectionLocked(std::string_view key) const {
    std::string prefix(key);
    prefix += '.';
    for (const auto& entry : entries_) {
        if (entry.first.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace crs::foundation
