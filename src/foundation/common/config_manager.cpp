#include "tts/foundation/config_manager.hpp"

#include <algorithm>

namespace tts::foundation {

namespace {

GameError parseError(const YAML::Exception& e) {
    return GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what());
}

}  // namespace

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(parseError(e));
    }
    adopt(root);
    return GameResult<void>::ok();
}

GameResult<void> ConfigManager::loadFromString(std::string_view document) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(parseError(e));
    }
    adopt(root);
    return GameResult<void>::ok();
}

void ConfigManager::adopt(const YAML::Node& root) {
    std::lock_guard lock(mutex_);
    entries_.clear();
    flatten("", root);
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysWithPrefix(std::string_view prefix) const {
    std::string head = std::string(prefix) + ".";
    std::vector<std::string> keys;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, node] : entries_) {
            if (key.starts_with(head)) {
                keys.push_back(key);
            }
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Leaf node (scalar, sequence, null), stored under its dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    // Invoked outside the lock so a callback may read the new value.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace tts::foundation
