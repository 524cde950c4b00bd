#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "lcs/foundation/service_result.hpp"

namespace lcs::foundation {

/// YAML configuration flattened into dotted keys ("lobby.joined_lobbies_limit").
///
/// yaml-cpp exceptions never escape: load failures become ConfigLoadFailed,
/// failed conversions become ConfigTypeMismatch.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    ServiceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    ServiceResult<void> loadFromString(std::string_view yaml);

    /// Typed value for a dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ServiceResult<T> get(std::string_view key) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
ServiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound,
                         "config key not found: " + std::string(key),
                         std::string(key)));
    }
    try {
        return ServiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::Exception&) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         "type mismatch for key: " + std::string(key),
                         std::string(key)));
    }
}

} // namespace lcs::foundation
