#pragma once

/// @file result_cache.hpp
/// @brief Thread-safe LRU cache for pure backend computations.
///
/// Keys are canonical strings of every input that determines the output,
/// so entries never go stale and can be shared freely between engines
/// and sessions.

#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace arank::service {

/// Sizing for a ResultCache.
struct CacheConfig {
    bool enabled = true;            ///< Disabled caches store nothing.
    std::size_t maxEntries = 4096;  ///< LRU capacity.
};

/// Thread-safe LRU cache keyed by canonical input strings.
///
/// Usage:
/// @code
///   ResultCache<math::IndexPair> cache(CacheConfig{.maxEntries = 128});
///   cache.put(key, pair);
///   if (auto hit = cache.get(key)) { return *hit; }
/// @endcode
template <typename V>
class ResultCache {
public:
    explicit ResultCache(CacheConfig config) : config_(config) {}

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /// Look up @p key and mark it most recently used.
    [[nodiscard]] std::optional<V> get(std::string_view key) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(std::string(key));
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        touch(it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->second;
    }

    /// Insert or replace @p key, evicting the least recently used entry
    /// when full.
    void put(std::string_view key, V value) {
        if (!config_.enabled || config_.maxEntries == 0) {
            return;
        }
        std::lock_guard lock(mutex_);
        auto k = std::string(key);

        auto it = index_.find(k);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            touch(it->second);
            return;
        }

        if (lru_.size() >= config_.maxEntries) {
            index_.erase(lru_.back().first);
            lru_.pop_back();
        }
        lru_.emplace_front(k, std::move(value));
        index_[std::move(k)] = lru_.begin();
    }

    bool invalidate(std::string_view key) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(std::string(key));
        if (it == index_.end()) {
            return false;
        }
        lru_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        lru_.clear();
        index_.clear();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return lru_.size();
    }

    [[nodiscard]] uint64_t hitCount() const {
        return hits_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t missCount() const {
        return misses_.load(std::memory_order_relaxed);
    }

    /// Hit rate in [0, 1]; 0 before any lookup.
    [[nodiscard]] double hitRate() const {
        auto h = hits_.load(std::memory_order_relaxed);
        auto total = h + misses_.load(std::memory_order_relaxed);
        return total == 0 ? 0.0 : static_cast<double>(h) / static_cast<double>(total);
    }

    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

private:
    using Entry = std::pair<std::string, V>;

    // Front = most recently used.
    void touch(typename std::list<Entry>::iterator it) {
        lru_.splice(lru_.begin(), lru_, it);
    }

    CacheConfig config_;
    std::list<Entry> lru_;
    std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace arank::service
