#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "lineup/foundation/lineup_result.hpp"

namespace lineup::foundation {

/// YAML configuration flattened into dotted keys.
///
/// A document such as
/// @code
///   matchmaking:
///     max_rating_distance: 200
/// @endcode
/// is reachable as get<int>("matchmaking.max_rating_distance").
/// The tree is flattened on load to avoid yaml-cpp's reference semantics.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    LineupResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    LineupResult<void> loadFromString(std::string_view document);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch.
    template <typename T>
    LineupResult<T> get(std::string_view key) const;

    /// Set a value by dotted key, replacing any loaded entry.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

template <typename T>
LineupResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return LineupResult<T>::err(
            LineupError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return LineupResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return LineupResult<T>::err(
            LineupError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace lineup::foundation
