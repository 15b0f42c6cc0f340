#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed access and change watchers.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "tts/foundation/game_result.hpp"

namespace tts::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration flattened into dotted keys ("store.directory").
///
/// The tree is flattened on load so lookups never walk yaml-cpp nodes,
/// which have reference semantics that make shared mutation error-prone.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GameResult<void> loadFromString(std::string_view document);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back to @p fallback when the key is
    /// absent or has the wrong type.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers registered for it.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when @p key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys starting with "<prefix>.", in lexicographic order.
    [[nodiscard]] std::vector<std::string> keysWithPrefix(std::string_view prefix) const;

private:
    /// Replace every entry with the flattened contents of @p root.
    void adopt(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (!result) {
        return fallback;
    }
    return std::move(result).value();
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace tts::foundation
