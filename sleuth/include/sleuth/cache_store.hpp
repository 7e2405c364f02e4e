#pragma once
// CacheStore: bounded, time-expiring cache for generated content
//
// Keeps an insertion/access ordering: reading an entry moves it to the
// newest end, inserting a new key at capacity evicts from the oldest end.
// Expiry is lazy: an expired entry is removed when it is next read (or by
// an explicit cleanup_expired() call). There is no background sweeper.
//
// Thread-safe: one mutex per store, never held while computing a value.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace sleuth {

using Clock = std::chrono::steady_clock;
using Ttl = std::chrono::milliseconds;

template <typename T>
struct CacheEntry {
    T content;
    Clock::time_point created_at;
    uint64_t access_count = 0;
    Ttl ttl{0};

    bool expired(Clock::time_point at) const {
        return at > created_at + ttl;
    }
};

struct CacheStats {
    size_t size = 0;
    size_t max_size = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;

    uint64_t total_requests() const { return hits + misses; }

    // Percentage, 0 when nothing was requested yet
    double hit_rate() const {
        uint64_t total = total_requests();
        return total > 0 ? 100.0 * static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

struct CacheConfig {
    size_t max_size = 200;
    Ttl default_ttl = std::chrono::hours(2);
};

template <typename T>
class CacheStore {
public:
    CacheStore() : CacheStore(CacheConfig{}) {}

    explicit CacheStore(CacheConfig config) : config_(config) {
        if (config_.max_size == 0) config_.max_size = 1;
    }

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    std::optional<T> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_++;
            return std::nullopt;
        }

        auto node = it->second;
        if (node->second.expired(Clock::now())) {
            order_.erase(node);
            index_.erase(it);
            misses_++;
            return std::nullopt;
        }

        // Most recently used goes to the back
        order_.splice(order_.end(), order_, node);
        node->second.access_count++;
        hits_++;
        return node->second.content;
    }

    void set(const std::string& key, T content) {
        set(key, std::move(content), config_.default_ttl);
    }

    void set(const std::string& key, T content, Ttl ttl) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            // Replacing never evicts
            order_.erase(it->second);
            index_.erase(it);
        } else if (index_.size() >= config_.max_size && !order_.empty()) {
            index_.erase(order_.front().first);
            order_.pop_front();
        }

        CacheEntry<T> entry{std::move(content), Clock::now(), 0, ttl};
        order_.emplace_back(key, std::move(entry));
        index_[key] = std::prev(order_.end());
    }

    // Two callers racing on the same key may both compute; the later set wins.
    template <typename Fn>
    T get_or_compute(const std::string& key, Fn&& compute) {
        return get_or_compute(key, std::forward<Fn>(compute), config_.default_ttl);
    }

    template <typename Fn>
    T get_or_compute(const std::string& key, Fn&& compute, Ttl ttl) {
        if (auto cached = get(key)) {
            return std::move(*cached);
        }
        T value = compute();
        set(key, value, ttl);
        return value;
    }

    // Presence check that does not touch ordering or statistics
    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        return it != index_.end() && !it->second->second.expired(Clock::now());
    }

    bool invalidate(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    // Drop every key containing `fragment` (e.g. everything about one character)
    size_t invalidate_matching(const std::string& fragment) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = order_.begin(); it != order_.end(); ) {
            if (it->first.find(fragment) != std::string::npos) {
                index_.erase(it->first);
                it = order_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.clear();
        index_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    size_t cleanup_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto at = Clock::now();
        size_t removed = 0;
        for (auto it = order_.begin(); it != order_.end(); ) {
            if (it->second.expired(at)) {
                index_.erase(it->first);
                it = order_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats s;
        s.size = index_.size();
        s.max_size = config_.max_size;
        s.hits = hits_;
        s.misses = misses_;
        return s;
    }

    const CacheConfig& config() const { return config_; }

private:
    using Node = std::pair<std::string, CacheEntry<T>>;

    CacheConfig config_;
    mutable std::mutex mutex_;
    std::list<Node> order_;   // front = oldest
    std::unordered_map<std::string, typename std::list<Node>::iterator> index_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

// Cache for generated prose (introductions, narrations)
using TextCache = CacheStore<std::string>;

} // namespace sleuth
