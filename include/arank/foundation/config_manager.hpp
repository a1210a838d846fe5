#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration store with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "arank/foundation/rank_result.hpp"

namespace arank::foundation {

/// Configuration store loaded from YAML.
///
/// The tree is flattened into dotted keys ("ranking.k", "backend.mode")
/// on load, which sidesteps yaml-cpp's reference semantics when nodes are
/// read from several threads.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    RankResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    RankResult<void> loadString(std::string_view yaml);

    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    RankResult<T> get(std::string_view key) const;

    /// Like get(), but an absent key yields @p fallback.
    /// A present key of the wrong type is still an error.
    template <typename T>
    RankResult<T> getOr(std::string_view key, T fallback) const;

    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
RankResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return RankResult<T>::err(
            RankError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return RankResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return RankResult<T>::err(
            RankError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
RankResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return RankResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace arank::foundation
